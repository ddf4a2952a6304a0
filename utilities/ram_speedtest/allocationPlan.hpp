#ifndef ALLOCATION_PLAN_H
#define ALLOCATION_PLAN_H

#include <cstdint>

#include "memInfoProbe.hpp"

#define MiB_BYTES (1024ULL*1024ULL)
#define GiB_BYTES (1024ULL*1024ULL*1024ULL)

/// Headroom left for the operating system when sizing against total memory
#define ALLOCATION_RESERVE_BYTES        (128ULL*MiB_BYTES)
/// Margin kept below the currently available memory
#define ALLOCATION_FALLBACK_MARGIN_BYTES (64ULL*MiB_BYTES)
/// No plan is ever smaller than this
#define ALLOCATION_FLOOR_BYTES          (256ULL*MiB_BYTES)
/// Plan used when the memory probe could not report the total
#define ALLOCATION_UNKNOWN_TOTAL_BYTES  (1ULL*GiB_BYTES)

/** \struct  AllocationPlan
 *  \brief   Number of bytes the benchmark engine must allocate for a single run
 */
struct AllocationPlan
{
    uint64_t u64Target_bytes;
};

/** Size the benchmark buffer as close to 100% of physical memory as possible.
 *  \details The target is total memory less a small reserve, capped by what is currently available
 *           less a margin. The result deliberately may exceed the available memory: the operating
 *           system is allowed to page in order to satisfy a "near 100%" request.
 *  \param   sInfo A fresh reading from probe_memory().
 */
AllocationPlan plan_allocation(const MemoryInfo &sInfo);

/// Plan for an explicit size, bypassing the sizing policy. Used when the user overrides the size.
AllocationPlan plan_fixed_allocation(uint64_t u64Size_bytes);

/** Convert a size given in MiB to bytes.
 *  \param  i64Size_MiB   Size as typed by the user.
 *  \param  u64Size_bytes Set to the size in bytes on success, untouched otherwise.
 *  \return False if the size is negative or the byte count does not fit in 64 bits.
 */
bool mib_to_bytes(int64_t i64Size_MiB, uint64_t &u64Size_bytes);

#endif
