#ifndef BENCHMARK_TYPES_H
#define BENCHMARK_TYPES_H

#include <cstdint>
#include <string>

/// Divisor that turns bytes per second into the GiB/s figures reported everywhere in this project
#define BYTES_PER_GIB (1024.0*1024.0*1024.0)

/** Convert a byte count and the time it took into GiB/s.
 *  \return 0 when dTime_s is not positive so callers never divide by zero.
 */
double rate_GBps(uint64_t u64Bytes, double dTime_s);

/// Reasons a run can end without a valid measurement
enum ErrorKind
{
    ERROR_NONE,
    ERROR_ALLOCATION_FAILURE,
    ERROR_WRITE_PHASE_FAILURE,
    ERROR_READ_PHASE_FAILURE,
    ERROR_PROBE_DEGRADED,
    ERROR_UNEXPECTED_FAILURE
};

/// Short name for an error kind, e.g. "AllocationFailure".
const char *error_kind_name(ErrorKind eErrorKind);

/** \struct  ProgressSnapshot
 *  \brief   Periodic progress report emitted by the engine while it loops
 *  \details Instantaneous rates cover only the bytes moved since the previous snapshot. Average rates
 *           cover the whole run so far.
 */
struct ProgressSnapshot
{
    ProgressSnapshot();

    double   dElapsed_s;
    double   dRemaining_s;
    int64_t  i64LoopCount;
    double   dInstantaneousWrite_GBps;
    double   dInstantaneousRead_GBps;
    double   dInstantaneousTotal_GBps;
    double   dAverageWrite_GBps;
    double   dAverageRead_GBps;
    uint32_t u32RunningChecksum;
};

/** \struct  BenchmarkResult
 *  \brief   Terminal record of a single benchmark run
 *  \details One full write and one full read of the buffer happen per loop, so for any result
 *           without an error u64Write_bytes == u64Read_bytes == i64LoopCount * u64Allocated_bytes.
 *           When a phase fails the counters hold whatever had been accumulated before the failure.
 */
struct BenchmarkResult
{
    BenchmarkResult();

    bool        bOk;
    ErrorKind   eErrorKind;
    std::string strErrorMessage;

    uint64_t    u64Allocated_bytes;
    double      dConfiguredDuration_s;
    uint64_t    u64Write_bytes;
    uint64_t    u64Read_bytes;
    double      dWriteTime_s;
    double      dReadTime_s;
    uint32_t    u32Checksum;
    int64_t     i64LoopCount;

    /// Local wall-clock stamps, "YYYY-MM-DD HH:MM:SS"
    std::string strStartedAt;
    std::string strEndedAt;

    bool   has_error() const;
    double write_GBps() const;
    double read_GBps() const;
    double total_GBps() const;
};

#endif
