#include "announcer.hpp"
#include <spdlog/spdlog.h>

AnnouncementQueue::AnnouncementQueue(SpeechOutput &output, const SpeechConfig &cfg, TimeSource now)
    : output(output), cfg(cfg), now(std::move(now)), enabled_(cfg.enabled) {}

bool AnnouncementQueue::speak(const std::string &text, bool priority, bool force) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!enabled_ || text.empty()) return false;

    auto t = now();
    if (!force && text == last_text_ &&
        t - last_time_ < std::chrono::milliseconds(cfg.dedup_cooldown_ms)) {
        spdlog::debug("[Announcer] suppressed duplicate '{}'", text);
        return false;
    }
    last_text_ = text;
    last_time_ = t;

    if (priority) interruptLocked();

    queue_.push_back(text);
    processLocked();
    return true;
}

void AnnouncementQueue::utteranceFinished(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!speaking_ || id != current_id_) return;
    speaking_ = false;
    retries_ = 0;
    current_.clear();
    processLocked();
}

void AnnouncementQueue::utteranceFailed(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!speaking_ || id != current_id_) {
        spdlog::debug("[Announcer] ignoring stale failure for utterance {}", id);
        return;
    }
    speaking_ = false;

    if (retries_ < cfg.max_retries) {
        retries_++;
        spdlog::warn("[Announcer] utterance failed, retrying ({}/{})", retries_, cfg.max_retries);
        queue_.push_front(current_);
    } else {
        spdlog::warn("[Announcer] dropping '{}' after {} retries", current_, retries_);
        retries_ = 0;
    }
    current_.clear();
    processLocked();
}

void AnnouncementQueue::cancelAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    interruptLocked();
}

void AnnouncementQueue::setEnabled(bool on) {
    std::lock_guard<std::mutex> lock(mutex_);
    enabled_ = on;
    if (!on) interruptLocked();
}

bool AnnouncementQueue::enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_;
}

bool AnnouncementQueue::speaking() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return speaking_;
}

size_t AnnouncementQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::string AnnouncementQueue::lastSpoken() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_text_;
}

void AnnouncementQueue::interruptLocked() {
    if (speaking_) output.cancel();
    queue_.clear();
    speaking_ = false;
    retries_ = 0;
    current_.clear();
}

void AnnouncementQueue::processLocked() {
    if (speaking_ || queue_.empty()) return;
    current_ = queue_.front();
    queue_.pop_front();
    speaking_ = true;
    current_id_ = ++next_id_;
    output.say(current_id_, current_);
}
