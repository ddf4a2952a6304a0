#ifndef REPORTING_H
#define REPORTING_H

#include <cstdint>
#include <string>
#include <vector>

#include "benchmarkTypes.hpp"
#include "memInfoProbe.hpp"

/** Human readable size with 1024 steps, e.g. "512 B", "1.50 KB", "15.63 GB".
 *  Whole bytes have no decimals, every larger unit has two.
 */
std::string bytes_to_human(uint64_t u64Bytes);

/// Seconds as "mm:ss". Fractions are truncated, negative values show as "00:00" and minutes may exceed 99.
std::string format_mmss(double dSeconds);

/// A rate with two decimals followed by the unit, e.g. "12.34 GB/s".
std::string format_rate(double dRate_GBps);

/// Checksum as "0x" followed by eight upper case hex digits.
std::string format_checksum(uint32_t u32Checksum);

/// One line describing a snapshot: "01:05 / 02:00  Write: ... | Read: ... | Total: ... | loops: n".
std::string format_progress_line(const ProgressSnapshot &sSnapshot, double dDuration_s);

/// Header line for format_progress_csv().
std::string progress_csv_header();

/// Snapshot as comma separated values in the column order of progress_csv_header().
std::string format_progress_csv(const ProgressSnapshot &sSnapshot);

/** The summary printed after a run, one entry per line.
 *  \param oResult          Terminal result of the run.
 *  \param sMemoryAfter     Probe taken once the run has ended.
 *  \param u64ProcessRss_bytes Resident size of this process once the run has ended.
 */
std::vector<std::string> format_result_summary(const BenchmarkResult &oResult, const MemoryInfo &sMemoryAfter,
                                               uint64_t u64ProcessRss_bytes);

/** Outcome word for the end of the summary.
 *  \param oResult         Terminal result of the run.
 *  \param bStopRequested  True if the run was cancelled before its duration elapsed.
 *  \return "FAILED" when the result is not ok, otherwise "STOPPED" or "DONE".
 */
const char *run_status(const BenchmarkResult &oResult, bool bStopRequested);

/// Warning tagged ProbeDegraded when the probe could not read the memory size, empty otherwise.
std::string format_probe_warning(const MemoryInfo &sInfo);

/// Header line for format_result_csv().
std::string result_csv_header();

/// Result as comma separated values in the column order of result_csv_header().
std::string format_result_csv(const BenchmarkResult &oResult);

#endif
