#include "benchmarkRun.hpp"
#include "memSpeedTest.hpp"
#include "Utils.hpp"

#include <iostream>
#include <system_error>

std::atomic<bool> BenchmarkRun::s_bRunActive(false);

BenchmarkRun::BenchmarkRun(uint64_t u64Target_bytes, double dDuration_s, bool bUseHugePages,
                           std::shared_ptr<MemAccessor> pAccessor):
    m_u64Target_bytes(u64Target_bytes),
    m_dDuration_s(dDuration_s),
    m_bUseHugePages(bUseHugePages),
    m_pAccessor(pAccessor)
{
}

BenchmarkRun::~BenchmarkRun()
{
    m_oCancel.cancel();
    if (m_workerThread.joinable())
    {
        m_workerThread.join();
    }
}

std::unique_ptr<BenchmarkRun> BenchmarkRun::start(uint64_t u64Target_bytes, double dDuration_s, bool bUseHugePages)
{
    return start(u64Target_bytes, dDuration_s, bUseHugePages, std::make_shared<DefaultMemAccessor>());
}

std::unique_ptr<BenchmarkRun> BenchmarkRun::start(uint64_t u64Target_bytes, double dDuration_s, bool bUseHugePages,
                                                  std::shared_ptr<MemAccessor> pAccessor)
{
    bool bExpected = false;
    if (!s_bRunActive.compare_exchange_strong(bExpected, true))
    {
        std::cerr << "WARNING: A benchmark run is already active, ignoring the request to start another" << std::endl;
        return std::unique_ptr<BenchmarkRun>();
    }

    std::unique_ptr<BenchmarkRun> pRun(new BenchmarkRun(u64Target_bytes, dDuration_s, bUseHugePages, pAccessor));
    try
    {
        pRun->m_workerThread = std::thread(&BenchmarkRun::work, pRun.get());
    }
    catch (const std::system_error &)
    {
        s_bRunActive.store(false);
        throw;
    }
    return pRun;
}

void BenchmarkRun::work()
{
    BenchmarkResult oResult;
    try
    {
        MemSpeedTest oMemSpeedTest(m_pAccessor, m_bUseHugePages);
        ProgressChannel &oChannel = m_oChannel;
        oResult = oMemSpeedTest.run(m_u64Target_bytes, m_dDuration_s, m_oCancel,
                                    [&oChannel](const ProgressSnapshot &sSnapshot) { oChannel.push_progress(sSnapshot); });
    }
    catch (const std::exception &e)
    {
        // The engine reports its own failures in the result. Anything caught here came from outside it.
        oResult = BenchmarkResult();
        oResult.eErrorKind = ERROR_UNEXPECTED_FAILURE;
        oResult.strErrorMessage = e.what();
        oResult.dConfiguredDuration_s = MemSpeedTest::clamp_duration(m_dDuration_s);
        oResult.strEndedAt = get_timestamp();
    }

    // The buffer is gone by now so another run may start
    s_bRunActive.store(false);
    m_oChannel.push_result(oResult);
}

std::vector<ChannelMessage> BenchmarkRun::poll()
{
    return m_oChannel.drain();
}

void BenchmarkRun::cancel()
{
    m_oCancel.cancel();
}

bool BenchmarkRun::is_finished() const
{
    return m_oChannel.is_closed();
}

bool BenchmarkRun::is_run_active()
{
    return s_bRunActive.load();
}
