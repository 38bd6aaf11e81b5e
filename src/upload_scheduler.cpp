#include "facewatch/upload_scheduler.hpp"

#include <algorithm>
#include <exception>
#include <iomanip>
#include <iostream>
#include <utility>

namespace facewatch {

UploadGate::UploadGate(Seconds delay)
    : delay_(std::chrono::duration_cast<Clock::duration>(delay)) {}

UploadStatus UploadGate::status(TimePoint now) const {
    const Clock::rep last = last_slot_.load(std::memory_order_acquire);
    if (last == kNoSlot) return UploadStatus{};

    const TimePoint next = TimePoint(Clock::duration(last)) + delay_;
    if (now >= next) return UploadStatus{};
    return UploadStatus{Seconds(next - now), false};
}

TimePoint UploadGate::reserve(TimePoint now) {
    Clock::rep cur = last_slot_.load(std::memory_order_acquire);
    for (;;) {
        TimePoint slot = now;
        if (cur != kNoSlot) {
            slot = std::max(now, TimePoint(Clock::duration(cur)) + delay_);
        }
        if (last_slot_.compare_exchange_weak(cur, slot.time_since_epoch().count(),
                                             std::memory_order_acq_rel,
                                             std::memory_order_acquire)) {
            return slot;
        }
    }
}

const char* submit_outcome_to_string(SubmitOutcome outcome) {
    switch (outcome) {
        case SubmitOutcome::Deferred: return "deferred";
        case SubmitOutcome::Rejected: return "rejected";
        default: return "accepted";
    }
}

UploadScheduler::UploadScheduler(EventStore& store, Seconds global_delay, size_t queue_capacity)
    : store_(store), gate_(global_delay), queue_(queue_capacity) {}

UploadScheduler::~UploadScheduler() {
    stop(false);
}

void UploadScheduler::start() {
    if (running_.exchange(true)) return;
    worker_ = std::thread(&UploadScheduler::run, this);
}

void UploadScheduler::stop(bool drain) {
    if (!running_.exchange(false)) return;
    if (!drain) {
        {
            std::lock_guard<std::mutex> lock(wake_mu_);
            abandon_ = true;
        }
        size_t dropped = queue_.clear();
        if (dropped > 0) {
            std::cerr << "[upload] Abandoning " << dropped << " pending upload(s) at shutdown" << std::endl;
        }
    }
    queue_.stop();
    wake_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void UploadScheduler::set_observer(UploadObserver observer) {
    std::lock_guard<std::mutex> lock(observer_mu_);
    observer_ = std::move(observer);
}

SubmitResult UploadScheduler::submit(EventRecord record, TimePoint now) {
    const EventKind kind = record.kind;
    std::lock_guard<std::mutex> lock(submit_mu_);

    if (queue_.full()) {
        rejected_++;
        std::cerr << "[upload] Queue full (" << queue_.capacity() << "), dropping "
                  << event_kind_to_string(kind) << " event" << std::endl;
        return SubmitResult{SubmitOutcome::Rejected, gate_.status(now).remaining_delay};
    }

    const TimePoint slot = gate_.reserve(now);
    if (!queue_.try_push(Job{std::move(record), slot})) {
        rejected_++;
        std::cerr << "[upload] Scheduler stopped, dropping " << event_kind_to_string(kind)
                  << " event" << std::endl;
        return SubmitResult{SubmitOutcome::Rejected, Seconds(0.0)};
    }

    if (slot <= now) {
        return SubmitResult{SubmitOutcome::Accepted, Seconds(0.0)};
    }
    const Seconds remaining = slot - now;
    std::cout << "[upload] " << event_kind_to_string(kind) << " upload deferred by "
              << std::fixed << std::setprecision(1) << remaining.count() << " seconds\n";
    return SubmitResult{SubmitOutcome::Deferred, remaining};
}

bool UploadScheduler::wait_until(TimePoint when) {
    std::unique_lock<std::mutex> lock(wake_mu_);
    bool abandoned = wake_cv_.wait_until(lock, when, [&] { return abandon_.load(); });
    return !abandoned;
}

void UploadScheduler::run() {
    Job job;
    while (queue_.pop(job)) {
        TimePoint start_at = job.slot;
        if (last_started_) {
            start_at = std::max(start_at, *last_started_ + gate_.delay());
        }
        if (!wait_until(start_at)) break;

        const TimePoint started = Clock::now();
        last_started_ = started;

        SaveResult result;
        try {
            result = store_.save_event(job.record);
        } catch (const std::exception& e) {
            result = SaveResult::failure(e.what());
        }

        if (result.ok) {
            uploaded_++;
            std::cout << "[upload] " << event_kind_to_string(job.record.kind)
                      << " event saved: " << result.id << "\n";
        } else {
            // Best effort: a failed upload is dropped, not retried.
            failed_++;
            std::cerr << "[upload] Failed to save " << event_kind_to_string(job.record.kind)
                      << " event: " << result.error << std::endl;
        }

        UploadObserver observer;
        {
            std::lock_guard<std::mutex> lock(observer_mu_);
            observer = observer_;
        }
        if (observer) observer(job.record, started, result);
    }
}

}  // namespace facewatch
