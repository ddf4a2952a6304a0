#ifndef PROGRESS_CHANNEL_H
#define PROGRESS_CHANNEL_H

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

#include "benchmarkTypes.hpp"

/// Number of progress messages that may be waiting before new ones are dropped
#define DEFAULT_PROGRESS_CAPACITY 256

/** \struct  ChannelMessage
 *  \brief   One message from the benchmark worker to the controlling thread
 *  \details Only the member matching eType is meaningful. MESSAGE_DONE and MESSAGE_ERROR both carry
 *           the terminal BenchmarkResult; MESSAGE_ERROR is used when that result holds an error.
 */
struct ChannelMessage
{
    enum MessageType
    {
        MESSAGE_PROGRESS,
        MESSAGE_DONE,
        MESSAGE_ERROR
    };

    MessageType      eType;
    ProgressSnapshot sProgress;
    BenchmarkResult  oResult;

    bool is_terminal() const { return eType != MESSAGE_PROGRESS; }
};

/** \class      ProgressChannel
 *  \brief      Ordered queue between a single producer and a single consumer
 *  \details    The producer never waits for the consumer. Progress messages are advisory: when
 *              ulProgressCapacity of them are already queued the oldest is discarded to make room
 *              for the new one, so a consumer that falls behind still sees the latest snapshots. The terminal
 *              message is never dropped, is accepted exactly once and closes the channel, so it is
 *              always the last message the consumer sees.
 */
class ProgressChannel
{
    public:
        explicit ProgressChannel(size_t ulProgressCapacity = DEFAULT_PROGRESS_CAPACITY);

        ProgressChannel(const ProgressChannel &) = delete;
        ProgressChannel &operator=(const ProgressChannel &) = delete;

        /// Queue a snapshot, discarding the oldest queued one if the queue is full. Returns false if the channel is closed.
        bool push_progress(const ProgressSnapshot &sSnapshot);

        /// Queue the terminal result and close the channel. Returns false if a terminal result was already sent.
        bool push_result(const BenchmarkResult &oResult);

        /// Remove and return everything queued, oldest first. Returns an empty list rather than waiting.
        std::vector<ChannelMessage> drain();

        /// True once the terminal result has been pushed.
        bool is_closed() const;

        /// Number of progress messages discarded or refused so far.
        size_t get_dropped_count() const;

    private:
        mutable std::mutex m_mutex;
        std::deque<ChannelMessage> m_queue;
        size_t m_ulProgressCapacity;
        size_t m_ulQueuedProgress;
        size_t m_ulDropped;
        bool   m_bClosed;
};

#endif
