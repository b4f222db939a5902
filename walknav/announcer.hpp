#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include "config.hpp"

// Audio device port. say() starts one utterance and returns immediately; the
// device later reports completion through AnnouncementQueue::utteranceFinished
// or utteranceFailed with the same id, never from inside say(). Completions
// for a cancelled utterance may still arrive and are ignored.
class SpeechOutput {
public:
    virtual ~SpeechOutput() = default;
    virtual void say(uint64_t id, const std::string &text) = 0;
    virtual void cancel() = 0;
};

// One utterance audible at a time. Thread-safe.
class AnnouncementQueue {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    AnnouncementQueue(SpeechOutput &output, const SpeechConfig &cfg, TimeSource now = Clock::now);

    // Priority interrupts whatever is playing or queued. Identical text within
    // the cooldown is dropped unless forced. Returns false when dropped.
    bool speak(const std::string &text, bool priority = false, bool force = false);

    // Reports for any id other than the utterance playing now are stale.
    void utteranceFinished(uint64_t id);
    void utteranceFailed(uint64_t id);

    // Stop the current utterance and drop everything queued.
    void cancelAll();

    void setEnabled(bool on);
    bool enabled() const;
    bool speaking() const;
    size_t pending() const;
    std::string lastSpoken() const;

private:
    SpeechOutput &output;
    SpeechConfig cfg;
    TimeSource now;

    mutable std::mutex mutex_;
    std::deque<std::string> queue_;
    std::string current_;
    uint64_t current_id_ = 0;
    uint64_t next_id_ = 0;
    bool speaking_ = false;
    bool enabled_;
    int retries_ = 0;
    std::string last_text_;
    Clock::time_point last_time_;

    void interruptLocked();
    void processLocked();
};
