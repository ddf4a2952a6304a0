#include "ThroughputCountersTest.hpp"

#include <cmath>

static bool nearly_equal(double dA, double dB)
{
    return std::fabs(dA - dB) <= 1e-9 * std::fmax(1.0, std::fabs(dB));
}

ThroughputCountersTest::ThroughputCountersTest() :
    UnitTest("throughput_counters"),
    m_u64Buffer_bytes(0),
    m_i64Loops(0),
    m_u64Write_bytes(0)
{
}

ThroughputCountersTest::~ThroughputCountersTest()
{
}

void ThroughputCountersTest::simulate_input()
{
    m_u64Buffer_bytes = 1024ULL*1024ULL*1024ULL;
}

void ThroughputCountersTest::add_loop(ThroughputCounters &oCounters, double dWrite_s, double dRead_s)
{
    oCounters.add_write(m_u64Buffer_bytes, dWrite_s);
    oCounters.add_read(m_u64Buffer_bytes, dRead_s);
    oCounters.complete_loop();
}

void ThroughputCountersTest::run_operation()
{
    // Constant speed: 0.1 s writes, 0.05 s reads, a snapshot every 0.2 s worth of loops
    ThroughputCounters oConstant;
    double dElapsed_s = 0.0;
    for (int iSnapshot = 0; iSnapshot < 5; iSnapshot++)
    {
        for (int i = 0; i < 2; i++)
        {
            add_loop(oConstant, 0.1, 0.05);
            dElapsed_s += 0.15;
        }
        m_sConstant.push_back(oConstant.take_snapshot(dElapsed_s, 10.0, (uint32_t)iSnapshot));
    }

    // Nothing new happened since the last snapshot
    m_sIdle = oConstant.take_snapshot(dElapsed_s + 0.2, 10.0, 0);
    m_i64Loops = oConstant.get_loop_count();
    m_u64Write_bytes = oConstant.get_write_bytes();

    // Fast then twice as slow
    ThroughputCounters oChanging;
    add_loop(oChanging, 0.1, 0.1);
    m_sChanging.push_back(oChanging.take_snapshot(0.2, 10.0, 0));
    add_loop(oChanging, 0.2, 0.2);
    m_sChanging.push_back(oChanging.take_snapshot(0.6, 10.0, 0));

    // One iteration ran past the configured duration
    m_sOverrun = oChanging.take_snapshot(10.4, 10.0, 0);
}

void ThroughputCountersTest::verify_output()
{
    for (size_t i = 1; i < m_sConstant.size(); i++)
    {
        check(nearly_equal(m_sConstant[i].dInstantaneousTotal_GBps, m_sConstant[0].dInstantaneousTotal_GBps),
              "constant throughput should give equal instantaneous totals");
        check(m_sConstant[i].dElapsed_s > m_sConstant[i-1].dElapsed_s, "elapsed should increase");
        check(m_sConstant[i].i64LoopCount > m_sConstant[i-1].i64LoopCount, "loop count should increase");
    }
    check(nearly_equal(m_sConstant[0].dInstantaneousWrite_GBps, 10.0), "1 GiB in 0.1 s is 10 GiB/s");
    check(nearly_equal(m_sConstant[0].dInstantaneousRead_GBps, 20.0), "1 GiB in 0.05 s is 20 GiB/s");
    check(nearly_equal(m_sConstant[0].dInstantaneousTotal_GBps, 2.0/0.15), "total combines both phases");
    check(nearly_equal(m_sConstant.back().dAverageWrite_GBps, 10.0), "average write at constant speed");
    check(m_sConstant.back().u32RunningChecksum == 4, "snapshot carries the checksum it was given");

    check(m_sIdle.dInstantaneousTotal_GBps == 0.0 && m_sIdle.dInstantaneousWrite_GBps == 0.0,
          "an empty window has a zero rate");
    check(nearly_equal(m_sIdle.dAverageWrite_GBps, 10.0), "averages survive an empty window");
    check(m_i64Loops == 10 && m_u64Write_bytes == 10*m_u64Buffer_bytes, "cumulative counters");

    check(nearly_equal(m_sChanging[1].dInstantaneousWrite_GBps, 5.0), "window only covers the slow loop");
    check(nearly_equal(m_sChanging[1].dAverageWrite_GBps, 2.0/0.3), "average covers both loops");
    check(nearly_equal(m_sChanging[1].dRemaining_s, 9.4), "remaining time");

    check(m_sOverrun.dRemaining_s == 0.0, "remaining time never goes negative");
}
