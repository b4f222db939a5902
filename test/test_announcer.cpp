#include <gtest/gtest.h>
#include <cstdint>
#include <string>
#include <vector>
#include "announcer.hpp"

namespace {

struct FakeSpeech : SpeechOutput {
    std::vector<std::string> said;
    std::vector<uint64_t> ids;
    int cancels = 0;

    void say(uint64_t id, const std::string &text) override {
        ids.push_back(id);
        said.push_back(text);
    }
    void cancel() override { cancels++; }

    uint64_t playing() const { return ids.back(); }
};

struct FakeClock {
    AnnouncementQueue::Clock::time_point t{};

    AnnouncementQueue::TimeSource source() {
        return [this] { return t; };
    }
    void advance(int ms) { t += std::chrono::milliseconds(ms); }
};

}  // namespace

class AnnouncementQueueTest : public ::testing::Test {
protected:
    FakeSpeech speech;
    FakeClock clock;
    SpeechConfig cfg;
    AnnouncementQueue queue{speech, cfg, clock.source()};
};

TEST_F(AnnouncementQueueTest, PlaysFifoOneAtATime) {
    EXPECT_TRUE(queue.speak("one"));
    EXPECT_TRUE(queue.speak("two"));
    EXPECT_TRUE(queue.speak("three"));

    EXPECT_EQ(speech.said, (std::vector<std::string>{"one"}));
    EXPECT_TRUE(queue.speaking());
    EXPECT_EQ(queue.pending(), 2u);

    queue.utteranceFinished(speech.playing());
    queue.utteranceFinished(speech.playing());
    EXPECT_EQ(speech.said, (std::vector<std::string>{"one", "two", "three"}));

    queue.utteranceFinished(speech.playing());
    EXPECT_FALSE(queue.speaking());
    EXPECT_EQ(queue.pending(), 0u);
}

TEST_F(AnnouncementQueueTest, PriorityInterrupts) {
    queue.speak("one");
    queue.speak("two");
    queue.speak("urgent", true);

    EXPECT_EQ(speech.cancels, 1);
    EXPECT_EQ(speech.said, (std::vector<std::string>{"one", "urgent"}));
    EXPECT_EQ(queue.pending(), 0u);

    queue.utteranceFinished(speech.playing());
    EXPECT_FALSE(queue.speaking());
}

TEST_F(AnnouncementQueueTest, DuplicateSuppressedWithinCooldown) {
    EXPECT_TRUE(queue.speak("Back on route."));
    queue.utteranceFinished(speech.playing());

    clock.advance(2999);
    EXPECT_FALSE(queue.speak("Back on route."));
    EXPECT_FALSE(queue.speak("Back on route.", true));

    EXPECT_TRUE(queue.speak("Back on route.", false, true));

    clock.advance(3000);
    queue.utteranceFinished(speech.playing());
    EXPECT_TRUE(queue.speak("Back on route."));
    EXPECT_EQ(speech.said.size(), 3u);
}

TEST_F(AnnouncementQueueTest, DifferentTextIsNotSuppressed) {
    EXPECT_TRUE(queue.speak("a"));
    EXPECT_TRUE(queue.speak("b"));
    EXPECT_TRUE(queue.speak("a"));
    EXPECT_EQ(queue.lastSpoken(), "a");
}

TEST_F(AnnouncementQueueTest, CancelAllFlushes) {
    queue.speak("one");
    queue.speak("two");
    queue.cancelAll();

    EXPECT_EQ(speech.cancels, 1);
    EXPECT_FALSE(queue.speaking());
    EXPECT_EQ(queue.pending(), 0u);

    // a late completion from the device is harmless
    queue.utteranceFinished(speech.playing());
    queue.utteranceFailed(speech.playing());
    EXPECT_EQ(speech.said.size(), 1u);
}

TEST_F(AnnouncementQueueTest, RetriesThenDrops) {
    queue.speak("turn left");
    queue.speak("next");

    for (int i = 0; i < cfg.max_retries; i++) queue.utteranceFailed(speech.playing());
    EXPECT_EQ(speech.said.size(), 1u + cfg.max_retries);
    EXPECT_EQ(speech.said.back(), "turn left");

    queue.utteranceFailed(speech.playing());
    EXPECT_EQ(speech.said.back(), "next");
    EXPECT_EQ(queue.pending(), 0u);
}

TEST_F(AnnouncementQueueTest, DisabledIsSilent) {
    queue.speak("one");
    queue.setEnabled(false);
    EXPECT_FALSE(queue.enabled());
    EXPECT_EQ(speech.cancels, 1);

    EXPECT_FALSE(queue.speak("two", true, true));
    EXPECT_EQ(speech.said.size(), 1u);

    queue.setEnabled(true);
    EXPECT_TRUE(queue.speak("three"));
    EXPECT_EQ(speech.said.back(), "three");
}

TEST_F(AnnouncementQueueTest, LateCompletionOfInterruptedUtteranceIsIgnored) {
    queue.speak("one");
    uint64_t interrupted = speech.playing();
    queue.speak("urgent", true);
    queue.speak("three");

    // the device reports the cancelled "one" only after "urgent" started
    queue.utteranceFinished(interrupted);
    EXPECT_EQ(speech.said, (std::vector<std::string>{"one", "urgent"}));
    EXPECT_TRUE(queue.speaking());
    EXPECT_EQ(queue.pending(), 1u);

    queue.utteranceFailed(interrupted);
    EXPECT_EQ(speech.said, (std::vector<std::string>{"one", "urgent"}));

    queue.utteranceFinished(speech.playing());
    EXPECT_EQ(speech.said, (std::vector<std::string>{"one", "urgent", "three"}));
}

TEST_F(AnnouncementQueueTest, EveryUtteranceGetsAFreshId) {
    queue.speak("one");
    queue.speak("two");
    queue.utteranceFinished(speech.playing());

    ASSERT_EQ(speech.ids.size(), 2u);
    EXPECT_NE(speech.ids[0], speech.ids[1]);
}
