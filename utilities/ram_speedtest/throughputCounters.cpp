#include "throughputCounters.hpp"

ThroughputCounters::ThroughputCounters():
    m_u64Write_bytes(0),
    m_u64Read_bytes(0),
    m_dWriteTime_s(0.0),
    m_dReadTime_s(0.0),
    m_i64LoopCount(0),
    m_u64LastWrite_bytes(0),
    m_u64LastRead_bytes(0),
    m_dLastWriteTime_s(0.0),
    m_dLastReadTime_s(0.0)
{
}

void ThroughputCounters::add_write(uint64_t u64Bytes, double dTime_s)
{
    m_u64Write_bytes += u64Bytes;
    m_dWriteTime_s += dTime_s;
}

void ThroughputCounters::add_read(uint64_t u64Bytes, double dTime_s)
{
    m_u64Read_bytes += u64Bytes;
    m_dReadTime_s += dTime_s;
}

void ThroughputCounters::complete_loop()
{
    m_i64LoopCount++;
}

ProgressSnapshot ThroughputCounters::take_snapshot(double dElapsed_s, double dDuration_s, uint32_t u32Checksum)
{
    uint64_t u64DeltaWrite_bytes = m_u64Write_bytes - m_u64LastWrite_bytes;
    uint64_t u64DeltaRead_bytes = m_u64Read_bytes - m_u64LastRead_bytes;
    double dDeltaWrite_s = m_dWriteTime_s - m_dLastWriteTime_s;
    double dDeltaRead_s = m_dReadTime_s - m_dLastReadTime_s;

    ProgressSnapshot sSnapshot;
    sSnapshot.dElapsed_s = dElapsed_s > 0.0 ? dElapsed_s : 0.0;
    sSnapshot.dRemaining_s = dDuration_s > dElapsed_s ? dDuration_s - dElapsed_s : 0.0;
    sSnapshot.i64LoopCount = m_i64LoopCount;
    sSnapshot.dInstantaneousWrite_GBps = rate_GBps(u64DeltaWrite_bytes, dDeltaWrite_s);
    sSnapshot.dInstantaneousRead_GBps = rate_GBps(u64DeltaRead_bytes, dDeltaRead_s);
    sSnapshot.dInstantaneousTotal_GBps = rate_GBps(u64DeltaWrite_bytes + u64DeltaRead_bytes, dDeltaWrite_s + dDeltaRead_s);
    sSnapshot.dAverageWrite_GBps = rate_GBps(m_u64Write_bytes, m_dWriteTime_s);
    sSnapshot.dAverageRead_GBps = rate_GBps(m_u64Read_bytes, m_dReadTime_s);
    sSnapshot.u32RunningChecksum = u32Checksum;

    m_u64LastWrite_bytes = m_u64Write_bytes;
    m_u64LastRead_bytes = m_u64Read_bytes;
    m_dLastWriteTime_s = m_dWriteTime_s;
    m_dLastReadTime_s = m_dReadTime_s;
    return sSnapshot;
}
