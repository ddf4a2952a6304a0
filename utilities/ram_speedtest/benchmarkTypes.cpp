#include "benchmarkTypes.hpp"

double rate_GBps(uint64_t u64Bytes, double dTime_s)
{
    if (dTime_s <= 0.0)
    {
        return 0.0;
    }
    return (double)u64Bytes / dTime_s / BYTES_PER_GIB;
}

const char *error_kind_name(ErrorKind eErrorKind)
{
    switch (eErrorKind)
    {
        case ERROR_NONE:
            return "None";
        case ERROR_ALLOCATION_FAILURE:
            return "AllocationFailure";
        case ERROR_WRITE_PHASE_FAILURE:
            return "WritePhaseFailure";
        case ERROR_READ_PHASE_FAILURE:
            return "ReadPhaseFailure";
        case ERROR_PROBE_DEGRADED:
            return "ProbeDegraded";
        case ERROR_UNEXPECTED_FAILURE:
            return "UnexpectedFailure";
    }
    return "Unknown";
}

ProgressSnapshot::ProgressSnapshot():
    dElapsed_s(0.0),
    dRemaining_s(0.0),
    i64LoopCount(0),
    dInstantaneousWrite_GBps(0.0),
    dInstantaneousRead_GBps(0.0),
    dInstantaneousTotal_GBps(0.0),
    dAverageWrite_GBps(0.0),
    dAverageRead_GBps(0.0),
    u32RunningChecksum(0)
{
}

BenchmarkResult::BenchmarkResult():
    bOk(false),
    eErrorKind(ERROR_NONE),
    u64Allocated_bytes(0),
    dConfiguredDuration_s(0.0),
    u64Write_bytes(0),
    u64Read_bytes(0),
    dWriteTime_s(0.0),
    dReadTime_s(0.0),
    u32Checksum(0),
    i64LoopCount(0)
{
}

bool BenchmarkResult::has_error() const
{
    return eErrorKind != ERROR_NONE;
}

double BenchmarkResult::write_GBps() const
{
    return rate_GBps(u64Write_bytes, dWriteTime_s);
}

double BenchmarkResult::read_GBps() const
{
    return rate_GBps(u64Read_bytes, dReadTime_s);
}

double BenchmarkResult::total_GBps() const
{
    return rate_GBps(u64Write_bytes + u64Read_bytes, dWriteTime_s + dReadTime_s);
}
