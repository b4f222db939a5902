#include "guidance_session.hpp"
#include <spdlog/spdlog.h>

GuidanceSession::GuidanceSession(PositionSource &source, AnnouncementQueue &announcer,
                                 const GuidanceConfig &cfg, Listener listener)
    : source(source), announcer(announcer), cfg(cfg), listener(std::move(listener)), machine(cfg) {}

GuidanceSession::~GuidanceSession() {
    stop();
}

void GuidanceSession::start(const Route &route) {
    stop();

    dispatch(machine.start(route));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = false;
        queue_.clear();
        teardown_at_.reset();
    }

    int token = source.subscribe(
        [this](const PositionUpdate &u) { enqueue(Item{u, std::nullopt}); },
        [this](const PositionError &e) { enqueue(Item{std::nullopt, e}); });
    {
        std::lock_guard<std::mutex> lock(mutex_);
        token_ = token;
    }

    worker = std::thread(&GuidanceSession::process, this);
    spdlog::info("[GuidanceSession] started, {} instructions", route.instructions.size());
}

void GuidanceSession::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
        queue_.clear();
        teardown_at_.reset();
    }
    cv_.notify_all();

    detach();
    if (worker.joinable()) worker.join();

    // the worker is gone; the machine is ours again
    if (machine.state() != NavState::Idle) {
        dispatch(machine.clear());
        announcer.cancelAll();
    }
}

void GuidanceSession::repeatCurrentInstruction() {
    Item item;
    item.repeat = true;
    enqueue(item);
}

void GuidanceSession::enqueue(Item item) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) return;
        if (queue_.size() >= cfg.max_pending_updates) {
            spdlog::debug("[GuidanceSession] queue full, dropping oldest event");
            queue_.pop_front();
        }
        queue_.push_back(std::move(item));
    }
    cv_.notify_one();
}

void GuidanceSession::detach() {
    std::optional<int> token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        token.swap(token_);
    }
    if (token) source.unsubscribe(*token);
}

void GuidanceSession::process() {
    while (true) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto ready = [this] { return stop_ || !queue_.empty(); };

        if (teardown_at_) {
            if (!cv_.wait_until(lock, *teardown_at_, ready)) {
                // grace delay over: tear the session down
                teardown_at_.reset();
                lock.unlock();
                detach();
                dispatch(machine.finish());
                spdlog::info("[GuidanceSession] finished");
                return;
            }
        } else {
            cv_.wait(lock, ready);
        }

        if (stop_) return;

        Item item = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();

        handle(item);

        if (machine.state() == NavState::Arrived) {
            lock.lock();
            if (!teardown_at_ && !stop_) {
                teardown_at_ = Clock::now() + std::chrono::milliseconds(cfg.arrival_grace_ms);
            }
        }
    }
}

void GuidanceSession::handle(const Item &item) {
    // one bad reading must never end the session
    try {
        if (item.update) {
            dispatch(machine.onPositionUpdate(*item.update));
        } else if (item.error) {
            dispatch(machine.onPositionError(*item.error));
        } else if (item.repeat) {
            dispatch(machine.repeatCurrentInstruction());
        }
    } catch (const std::exception &e) {
        spdlog::error("[GuidanceSession] discarded position event: {}", e.what());
    }
}

void GuidanceSession::dispatch(const std::vector<SessionEvent> &events) {
    for (const auto &ev : events) {
        if (ev.type == SessionEventType::StateChanged) state_ = ev.state;
        if (ev.type == SessionEventType::Announcement) announcer.speak(ev.text, ev.priority, ev.force);

        if (!listener) continue;
        try {
            listener(ev);
        } catch (const std::exception &e) {
            spdlog::error("[GuidanceSession] listener failed: {}", e.what());
        }
    }
}
