#include "progressChannel.hpp"

ProgressChannel::ProgressChannel(size_t ulProgressCapacity):
    m_ulProgressCapacity(ulProgressCapacity),
    m_ulQueuedProgress(0),
    m_ulDropped(0),
    m_bClosed(false)
{
}

bool ProgressChannel::push_progress(const ProgressSnapshot &sSnapshot)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_bClosed || m_ulProgressCapacity == 0)
    {
        m_ulDropped++;
        return false;
    }

    // Until the channel is closed the queue holds nothing but progress, so the front is the oldest snapshot
    if (m_ulQueuedProgress >= m_ulProgressCapacity)
    {
        m_queue.pop_front();
        m_ulQueuedProgress--;
        m_ulDropped++;
    }

    ChannelMessage sMessage;
    sMessage.eType = ChannelMessage::MESSAGE_PROGRESS;
    sMessage.sProgress = sSnapshot;
    m_queue.push_back(sMessage);
    m_ulQueuedProgress++;
    return true;
}

bool ProgressChannel::push_result(const BenchmarkResult &oResult)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_bClosed)
    {
        return false;
    }

    ChannelMessage sMessage;
    sMessage.eType = oResult.has_error() ? ChannelMessage::MESSAGE_ERROR : ChannelMessage::MESSAGE_DONE;
    sMessage.oResult = oResult;
    m_queue.push_back(sMessage);
    m_bClosed = true;
    return true;
}

std::vector<ChannelMessage> ProgressChannel::drain()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<ChannelMessage> messages(m_queue.begin(), m_queue.end());
    m_queue.clear();
    m_ulQueuedProgress = 0;
    return messages;
}

bool ProgressChannel::is_closed() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_bClosed;
}

size_t ProgressChannel::get_dropped_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_ulDropped;
}
