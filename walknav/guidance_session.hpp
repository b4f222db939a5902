#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include "announcer.hpp"
#include "navigation.hpp"

// Position sensor port. After unsubscribe() returns no handler of that
// subscription may be invoked again.
class PositionSource {
public:
    using UpdateHandler = std::function<void(const PositionUpdate &)>;
    using ErrorHandler = std::function<void(const PositionError &)>;

    virtual ~PositionSource() = default;
    virtual int subscribe(UpdateHandler on_update, ErrorHandler on_error) = 0;
    virtual void unsubscribe(int token) = 0;
};

// Runs one NavigationStateMachine on its own thread. Position events are
// queued by the sensor callback and handled strictly one at a time; each
// event's announcements are dispatched before the next event is taken.
class GuidanceSession {
public:
    using Listener = std::function<void(const SessionEvent &)>;

    // Events raised by position updates reach the listener on the session
    // thread; those raised by start() and stop() (route summary, Cancelled)
    // reach it on the calling thread. It must not call start() or stop().
    GuidanceSession(PositionSource &source, AnnouncementQueue &announcer,
                    const GuidanceConfig &cfg, Listener listener = {});
    ~GuidanceSession();

    GuidanceSession(const GuidanceSession &) = delete;
    GuidanceSession &operator=(const GuidanceSession &) = delete;

    // Replaces any active route.
    void start(const Route &route);

    // Clear route: back to Idle, detached from the sensor, speech flushed.
    void stop();

    void repeatCurrentInstruction();

    NavState state() const { return state_.load(); }

private:
    using Clock = std::chrono::steady_clock;

    struct Item {
        std::optional<PositionUpdate> update;
        std::optional<PositionError> error;
        bool repeat = false;
    };

    PositionSource &source;
    AnnouncementQueue &announcer;
    GuidanceConfig cfg;
    Listener listener;

    NavigationStateMachine machine;
    std::atomic<NavState> state_{NavState::Idle};

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Item> queue_;
    bool stop_ = false;
    std::optional<Clock::time_point> teardown_at_;
    std::optional<int> token_;
    std::thread worker;

    void enqueue(Item item);
    void process();
    void handle(const Item &item);
    void dispatch(const std::vector<SessionEvent> &events);
    void detach();
};
