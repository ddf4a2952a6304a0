#ifndef BENCHMARK_RUN_H
#define BENCHMARK_RUN_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

#include "cancellationToken.hpp"
#include "memAccessor.hpp"
#include "progressChannel.hpp"

/** \class      BenchmarkRun
 *  \brief      Handle to a benchmark running on its own worker thread
 *  \details    start() spawns a worker that runs MemSpeedTest and returns straight away. The controlling
 *              thread then calls poll() at its own cadence and cancel() when the user asks to stop. The
 *              two threads share nothing but the ProgressChannel and the CancellationToken.
 *
 *              Only one run may be active per process since the buffer is sized against all of the
 *              machine's memory. A run counts as active from start() until its worker has released the
 *              buffer.
 */
class BenchmarkRun
{
    public:
        BenchmarkRun(const BenchmarkRun &) = delete;
        BenchmarkRun &operator=(const BenchmarkRun &) = delete;

        /// Cancels the run if it is still going and waits for the worker to exit.
        ~BenchmarkRun();

        /** Spawn a worker that benchmarks u64Target_bytes for dDuration_s.
         *  \return The handle, or a null pointer if another run is already active.
         */
        static std::unique_ptr<BenchmarkRun> start(uint64_t u64Target_bytes, double dDuration_s, bool bUseHugePages = false);

        /// As above with a caller supplied accessor for the timed phases.
        static std::unique_ptr<BenchmarkRun> start(uint64_t u64Target_bytes, double dDuration_s, bool bUseHugePages,
                                                   std::shared_ptr<MemAccessor> pAccessor);

        /// Drain every message queued by the worker without blocking.
        std::vector<ChannelMessage> poll();

        /// Ask the worker to stop after its current iteration. Calling this more than once has no further effect.
        void cancel();

        /// True once the worker has queued its terminal result.
        bool is_finished() const;

        /// True while any run in this process holds the benchmark buffer.
        static bool is_run_active();

    private:
        BenchmarkRun(uint64_t u64Target_bytes, double dDuration_s, bool bUseHugePages,
                     std::shared_ptr<MemAccessor> pAccessor);

        /// Body of the worker thread.
        void work();

        uint64_t m_u64Target_bytes;
        double   m_dDuration_s;
        bool     m_bUseHugePages;
        std::shared_ptr<MemAccessor> m_pAccessor;

        CancellationToken m_oCancel;
        ProgressChannel   m_oChannel;
        std::thread       m_workerThread;

        static std::atomic<bool> s_bRunActive;
};

#endif
