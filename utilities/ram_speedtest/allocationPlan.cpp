#include "allocationPlan.hpp"

#include <algorithm>
#include <limits>

/// Unsigned subtraction that stops at zero instead of wrapping.
static uint64_t saturating_sub(uint64_t u64A, uint64_t u64B)
{
    return u64A > u64B ? u64A - u64B : 0;
}

AllocationPlan plan_allocation(const MemoryInfo &sInfo)
{
    AllocationPlan sPlan;
    if (sInfo.u64Total_bytes == 0)
    {
        sPlan.u64Target_bytes = ALLOCATION_UNKNOWN_TOTAL_BYTES;
        return sPlan;
    }

    uint64_t u64Target_bytes = std::max<uint64_t>(ALLOCATION_FLOOR_BYTES,
                                        saturating_sub(sInfo.u64Total_bytes, ALLOCATION_RESERVE_BYTES));

    uint64_t u64HardFallback_bytes = u64Target_bytes;
    if (sInfo.u64Available_bytes > 0)
    {
        u64HardFallback_bytes = std::max<uint64_t>(ALLOCATION_FLOOR_BYTES,
                                         saturating_sub(sInfo.u64Available_bytes, ALLOCATION_FALLBACK_MARGIN_BYTES));
    }

    sPlan.u64Target_bytes = std::max<uint64_t>(ALLOCATION_FLOOR_BYTES, std::min<uint64_t>(u64Target_bytes, u64HardFallback_bytes));
    return sPlan;
}

AllocationPlan plan_fixed_allocation(uint64_t u64Size_bytes)
{
    AllocationPlan sPlan;
    sPlan.u64Target_bytes = u64Size_bytes;
    return sPlan;
}

bool mib_to_bytes(int64_t i64Size_MiB, uint64_t &u64Size_bytes)
{
    if (i64Size_MiB < 0 || (uint64_t)i64Size_MiB > std::numeric_limits<uint64_t>::max() / MiB_BYTES)
    {
        return false;
    }
    u64Size_bytes = (uint64_t)i64Size_MiB * MiB_BYTES;
    return true;
}
