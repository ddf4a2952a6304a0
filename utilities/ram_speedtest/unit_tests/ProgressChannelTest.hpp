#ifndef __PROGRESS_CHANNEL_TEST_HPP__
#define __PROGRESS_CHANNEL_TEST_HPP__

#include <vector>

#include "UnitTest.hpp"
#include "progressChannel.hpp"

/** Ordering, capacity and terminal message rules of the ProgressChannel, first from a single thread
 *  and then with a producer thread racing a draining consumer.
 */
class ProgressChannelTest : public UnitTest
{
    public:
        ProgressChannelTest();
        ~ProgressChannelTest();

    protected:
        void simulate_input() override;

        void run_operation() override;

        void verify_output() override;

    private:
        std::vector<ProgressSnapshot> m_sSnapshots;

        std::vector<bool> m_bProgressAccepted;
        bool m_bFirstResultAccepted;
        bool m_bSecondResultAccepted;
        bool m_bLateProgressAccepted;
        size_t m_ulDropped;
        std::vector<ChannelMessage> m_firstDrain;
        std::vector<ChannelMessage> m_secondDrain;
        ChannelMessage::MessageType m_eFailedType;

        std::vector<ChannelMessage> m_concurrentMessages;
};

#endif
