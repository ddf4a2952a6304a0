#ifndef CANCELLATION_TOKEN_H
#define CANCELLATION_TOKEN_H

#include <atomic>

/** \class   CancellationToken
 *  \brief   Flag shared between the controlling thread and the benchmark worker
 *  \details Set once by the controller, polled by the worker between loop iterations. Setting it more
 *           than once has no further effect.
 */
class CancellationToken
{
    public:
        CancellationToken() : m_bCancelled(false) {}

        CancellationToken(const CancellationToken &) = delete;
        CancellationToken &operator=(const CancellationToken &) = delete;

        void cancel() { m_bCancelled.store(true, std::memory_order_release); }

        bool is_cancelled() const { return m_bCancelled.load(std::memory_order_acquire); }

    private:
        std::atomic<bool> m_bCancelled;
};

#endif
