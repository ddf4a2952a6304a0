#ifndef THROUGHPUT_COUNTERS_H
#define THROUGHPUT_COUNTERS_H

#include <cstdint>

#include "benchmarkTypes.hpp"

/** \class      ThroughputCounters
 *  \brief      Accumulates the byte and time counters of a run
 *  \details    Keeps the cumulative totals that end up in the BenchmarkResult as well as a mark of the
 *              totals at the previous progress snapshot, so that take_snapshot() can report the rate
 *              over just the window since then.
 */
class ThroughputCounters
{
    public:
        ThroughputCounters();

        /// Record one timed write phase.
        void add_write(uint64_t u64Bytes, double dTime_s);

        /// Record one timed read phase.
        void add_read(uint64_t u64Bytes, double dTime_s);

        /// Record that a full write and read of the buffer completed.
        void complete_loop();

        /** Build a progress snapshot and move the window mark to the current totals.
         *  \param dElapsed_s       Wall time since the loop started.
         *  \param dDuration_s      Configured run duration, used for the remaining time.
         *  \param u32Checksum      Checksum folded so far.
         */
        ProgressSnapshot take_snapshot(double dElapsed_s, double dDuration_s, uint32_t u32Checksum);

        uint64_t get_write_bytes() const { return m_u64Write_bytes; }
        uint64_t get_read_bytes() const { return m_u64Read_bytes; }
        double   get_write_time() const { return m_dWriteTime_s; }
        double   get_read_time() const { return m_dReadTime_s; }
        int64_t  get_loop_count() const { return m_i64LoopCount; }

    private:
        uint64_t m_u64Write_bytes;
        uint64_t m_u64Read_bytes;
        double   m_dWriteTime_s;
        double   m_dReadTime_s;
        int64_t  m_i64LoopCount;

        /// Totals at the previous snapshot
        uint64_t m_u64LastWrite_bytes;
        uint64_t m_u64LastRead_bytes;
        double   m_dLastWriteTime_s;
        double   m_dLastReadTime_s;
};

#endif
