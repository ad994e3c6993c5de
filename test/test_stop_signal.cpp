#include <gtest/gtest.h>

#include "lifecycle/stop_signal.h"

#include <csignal>

TEST(StopSignalTest, SignalOnlyRaisesFlag)
{
    lifecycle::clearStopRequest();
    lifecycle::installStopSignals();
    EXPECT_FALSE(lifecycle::stopRequested());

    // процесс продолжает работу, выход делает цикл событий
    ASSERT_EQ(std::raise(SIGTERM), 0);
    EXPECT_TRUE(lifecycle::stopRequested());

    lifecycle::clearStopRequest();
    ASSERT_EQ(std::raise(SIGINT), 0);
    EXPECT_TRUE(lifecycle::stopRequested());

    lifecycle::clearStopRequest();
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
}
