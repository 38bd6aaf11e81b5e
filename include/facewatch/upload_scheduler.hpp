#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <mutex>
#include <optional>
#include <thread>

#include "facewatch/bounded_queue.hpp"
#include "facewatch/event_store.hpp"
#include "facewatch/frame_types.hpp"

namespace facewatch {

struct UploadStatus {
    Seconds remaining_delay{0.0};
    bool can_upload_now{true};
};

// Shared global upload gate. Holds the most recently reserved upload slot;
// reserve() hands out slots at least `delay` apart using compare-and-swap, so
// concurrent callers can never be given slots closer than the window.
class UploadGate {
public:
    explicit UploadGate(Seconds delay);

    // Pure read; does not change the gate.
    UploadStatus status(TimePoint now) const;

    // Returns the earliest slot >= now that keeps the window to the previous
    // reservation, and makes it the new last slot.
    TimePoint reserve(TimePoint now);

    Clock::duration delay() const { return delay_; }

private:
    static constexpr Clock::rep kNoSlot = std::numeric_limits<Clock::rep>::min();

    Clock::duration delay_;
    std::atomic<Clock::rep> last_slot_{kNoSlot};
};

enum class SubmitOutcome { Accepted, Deferred, Rejected };

const char* submit_outcome_to_string(SubmitOutcome outcome);

struct SubmitResult {
    SubmitOutcome outcome{SubmitOutcome::Accepted};
    Seconds remaining_delay{0.0};
};

// Routes every persistence call through one worker thread. Submissions get a
// slot from the shared gate and wait in a bounded FIFO; a full queue rejects
// the new event. The worker never starts an upload earlier than its slot, nor
// earlier than `delay` after the previous upload it started.
class UploadScheduler {
public:
    using UploadObserver =
        std::function<void(const EventRecord&, TimePoint started, const SaveResult&)>;

    UploadScheduler(EventStore& store, Seconds global_delay, size_t queue_capacity);
    ~UploadScheduler();

    UploadScheduler(const UploadScheduler&) = delete;
    UploadScheduler& operator=(const UploadScheduler&) = delete;

    void start();
    // drain=true runs queued uploads at their slots; false abandons them.
    void stop(bool drain = false);

    SubmitResult submit(EventRecord record, TimePoint now);

    UploadStatus upload_status(TimePoint now) const { return gate_.status(now); }

    // Invoked on the worker thread after each persistence call.
    void set_observer(UploadObserver observer);

    uint64_t uploaded() const { return uploaded_.load(); }
    uint64_t failed() const { return failed_.load(); }
    uint64_t rejected() const { return rejected_.load(); }
    size_t pending() const { return queue_.size(); }

private:
    struct Job {
        EventRecord record;
        TimePoint slot{};
    };

    void run();
    bool wait_until(TimePoint when);

    EventStore& store_;
    UploadGate gate_;
    BoundedQueue<Job> queue_;

    std::mutex submit_mu_;
    std::mutex wake_mu_;
    std::condition_variable wake_cv_;
    std::atomic<bool> running_{false};
    std::atomic<bool> abandon_{false};
    std::thread worker_;

    std::mutex observer_mu_;
    UploadObserver observer_;

    std::optional<TimePoint> last_started_;  // worker thread only
    std::atomic<uint64_t> uploaded_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> rejected_{0};
};

}  // namespace facewatch
