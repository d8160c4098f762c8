#include "SignalWatcher.h"

#include <gtest/gtest.h>

#include <csignal>

TEST(SignalWatcherTest, SignalOutsideSearchIsNotAbsorbed) {
    int cancels = 0;
    SignalWatcher watcher([&cancels] { ++cancels; });

    EXPECT_FALSE(watcher.absorb(SIGINT));
    EXPECT_EQ(cancels, 0);
}

TEST(SignalWatcherTest, FirstSignalDuringSearchCancelsIt) {
    int cancels = 0;
    SignalWatcher watcher([&cancels] { ++cancels; });

    SignalWatcher::SearchScope scope(watcher);
    EXPECT_TRUE(watcher.absorb(SIGINT));
    EXPECT_EQ(cancels, 1);

    // A second Ctrl+C while the search winds down terminates
    EXPECT_FALSE(watcher.absorb(SIGINT));
    EXPECT_FALSE(watcher.absorb(SIGTERM));
    EXPECT_EQ(cancels, 1);
}

TEST(SignalWatcherTest, SignalAfterSearchEndsIsNotAbsorbed) {
    int cancels = 0;
    SignalWatcher watcher([&cancels] { ++cancels; });

    {
        SignalWatcher::SearchScope scope(watcher);
    }
    EXPECT_FALSE(watcher.absorb(SIGTERM));
    EXPECT_EQ(cancels, 0);
}

TEST(SignalWatcherTest, EachSearchCanBeCancelledOnce) {
    int cancels = 0;
    SignalWatcher watcher([&cancels] { ++cancels; });

    {
        SignalWatcher::SearchScope scope(watcher);
        EXPECT_TRUE(watcher.absorb(SIGINT));
    }
    {
        SignalWatcher::SearchScope scope(watcher);
        EXPECT_TRUE(watcher.absorb(SIGINT));
    }
    EXPECT_EQ(cancels, 2);
}
