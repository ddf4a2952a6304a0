#ifndef MEM_INFO_PROBE_H
#define MEM_INFO_PROBE_H

#include <cstdint>

/** \struct  MemoryInfo
 *  \brief   Snapshot of the system's physical memory
 *  \details All fields are zero when the platform could not be queried. Callers must treat a zero
 *           total as "unknown" rather than as a machine without memory.
 */
struct MemoryInfo
{
    MemoryInfo();

    /// Total physical memory installed
    uint64_t u64Total_bytes;

    /// Memory available for new allocations without swapping
    uint64_t u64Available_bytes;

    /// Total minus available
    uint64_t u64Used_bytes;

    /// Used as a percentage of total, 0 to 100
    double dPercentUsed;
};

/** Build a MemoryInfo from the two values the platform reports. Used and percent are derived here so that
 *  every source of memory figures agrees on how they are calculated.
 *  \param u64Total_bytes       Total physical memory. Zero means unknown.
 *  \param u64Available_bytes   Available physical memory.
 */
MemoryInfo make_memory_info(uint64_t u64Total_bytes, uint64_t u64Available_bytes);

/** Query the physical memory of the system. Reads /proc/meminfo and falls back to sysinfo(2) when
 *  MemTotal or MemAvailable are missing. Never fails: a zeroed MemoryInfo is returned when neither
 *  source is usable.
 */
MemoryInfo probe_memory();

/// True when the probe could not determine the total memory and the returned figures are all zero.
bool is_probe_degraded(const MemoryInfo &sInfo);

/// Resident set size of the current process in bytes, read from /proc/self/statm. Returns 0 when unavailable.
uint64_t get_process_rss();

#endif
