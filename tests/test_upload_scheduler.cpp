#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <mutex>
#include <thread>
#include <vector>

#include "facewatch/upload_scheduler.hpp"
#include "test_helpers.hpp"

using namespace facewatch;
using std::chrono::milliseconds;
using std::chrono::seconds;
using testing_util::MockEventStore;
using testing_util::RecordingEventStore;

namespace {

EventRecord record_of(EventKind kind) {
    EventRecord r;
    r.kind = kind;
    r.payload = "{}";
    r.image = EmbeddedImage{};
    r.created_at = std::chrono::system_clock::now();
    return r;
}

void expect_spaced(std::vector<TimePoint> times, Clock::duration window) {
    std::sort(times.begin(), times.end());
    for (size_t i = 1; i < times.size(); ++i) {
        EXPECT_GE(times[i] - times[i - 1], window) << "uploads " << i - 1 << " and " << i;
    }
}

}  // namespace

TEST(UploadGateTest, OpenUntilFirstReservation) {
    UploadGate gate(Seconds(30));
    const TimePoint t0 = Clock::now();
    UploadStatus st = gate.status(t0);
    EXPECT_TRUE(st.can_upload_now);
    EXPECT_DOUBLE_EQ(st.remaining_delay.count(), 0.0);
    EXPECT_EQ(gate.reserve(t0), t0);
}

TEST(UploadGateTest, StatusIsAPureRead) {
    UploadGate gate(Seconds(30));
    const TimePoint t0 = Clock::now();
    gate.reserve(t0);

    UploadStatus a = gate.status(t0 + seconds(5));
    UploadStatus b = gate.status(t0 + seconds(5));
    EXPECT_FALSE(a.can_upload_now);
    EXPECT_NEAR(a.remaining_delay.count(), 25.0, 1e-6);
    EXPECT_DOUBLE_EQ(a.remaining_delay.count(), b.remaining_delay.count());
    EXPECT_TRUE(gate.status(t0 + seconds(30)).can_upload_now);
}

TEST(UploadGateTest, DeferredSlotHonoursGlobalWindow) {
    UploadGate gate(Seconds(30));
    const TimePoint t0 = Clock::now();
    EXPECT_EQ(gate.reserve(t0), t0);
    // Event of another kind five seconds later waits for the rest of the window.
    EXPECT_EQ(gate.reserve(t0 + seconds(5)), t0 + seconds(30));
}

// Scheduling each deferred upload from a snapshot of the remaining delay lets
// two deferred uploads land on the same instant.
TEST(UploadGateTest, SnapshotSchedulingAllowsTwoUploadsInsideWindow) {
    UploadGate gate(Seconds(30));
    const TimePoint t0 = Clock::now();
    gate.reserve(t0);

    const TimePoint a_at = t0 + seconds(5);
    const TimePoint b_at = t0 + seconds(6);
    const TimePoint a_fires = a_at + std::chrono::duration_cast<Clock::duration>(gate.status(a_at).remaining_delay);
    const TimePoint b_fires = b_at + std::chrono::duration_cast<Clock::duration>(gate.status(b_at).remaining_delay);

    EXPECT_LT(std::chrono::abs(b_fires - a_fires), seconds(30));
}

TEST(UploadGateTest, ReservationKeepsDeferredSlotsApart) {
    UploadGate gate(Seconds(30));
    const TimePoint t0 = Clock::now();
    gate.reserve(t0);

    const TimePoint a = gate.reserve(t0 + seconds(5));
    const TimePoint b = gate.reserve(t0 + seconds(6));
    EXPECT_EQ(a, t0 + seconds(30));
    EXPECT_EQ(b, t0 + seconds(60));
}

TEST(UploadGateTest, ConcurrentReservationsNeverShareAWindow) {
    UploadGate gate(Seconds(30));
    const TimePoint t0 = Clock::now();
    std::mutex mu;
    std::vector<TimePoint> slots;

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            std::vector<TimePoint> mine;
            for (int i = 0; i < 200; ++i) mine.push_back(gate.reserve(t0));
            std::lock_guard<std::mutex> lock(mu);
            slots.insert(slots.end(), mine.begin(), mine.end());
        });
    }
    for (auto& th : threads) th.join();

    ASSERT_EQ(slots.size(), 1600u);
    expect_spaced(slots, seconds(30));
}

TEST(UploadSchedulerTest, AcceptsImmediatelyThenDefers) {
    RecordingEventStore store;
    const auto window = milliseconds(150);
    UploadScheduler scheduler(store, window, 8);
    scheduler.start();

    const TimePoint t0 = Clock::now();
    SubmitResult a = scheduler.submit(record_of(EventKind::Motion), t0);
    EXPECT_EQ(a.outcome, SubmitOutcome::Accepted);

    const TimePoint t1 = t0 + milliseconds(30);
    SubmitResult b = scheduler.submit(record_of(EventKind::Face), t1);
    EXPECT_EQ(b.outcome, SubmitOutcome::Deferred);
    EXPECT_NEAR(b.remaining_delay.count(), 0.120, 1e-6);

    scheduler.stop(true);

    auto started = store.started();
    ASSERT_EQ(started.size(), 2u);
    EXPECT_EQ(store.records()[1].kind, EventKind::Face);
    // The deferred upload must not run before the window after the first slot.
    EXPECT_GE(started[1], t0 + window);
    EXPECT_EQ(scheduler.uploaded(), 2u);
}

TEST(UploadSchedulerTest, ConcurrentSubmissionsStaySpaced) {
    RecordingEventStore store;
    const auto window = milliseconds(25);
    UploadScheduler scheduler(store, window, 64);

    std::vector<TimePoint> observed;
    std::mutex mu;
    scheduler.set_observer([&](const EventRecord&, TimePoint started, const SaveResult& r) {
        EXPECT_TRUE(r.ok);
        std::lock_guard<std::mutex> lock(mu);
        observed.push_back(started);
    });
    scheduler.start();

    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&, p] {
            for (int i = 0; i < 3; ++i) {
                EventKind kind = (p + i) % 2 ? EventKind::Face : EventKind::Motion;
                SubmitResult r = scheduler.submit(record_of(kind), Clock::now());
                EXPECT_NE(r.outcome, SubmitOutcome::Rejected);
            }
        });
    }
    for (auto& th : producers) th.join();
    scheduler.stop(true);

    std::lock_guard<std::mutex> lock(mu);
    ASSERT_EQ(observed.size(), 12u);
    expect_spaced(observed, window);
    EXPECT_EQ(store.records().size(), 12u);
}

TEST(UploadSchedulerTest, RejectsNewEventsWhenQueueIsFull) {
    ::testing::StrictMock<MockEventStore> store;
    UploadScheduler scheduler(store, Seconds(30), 1);

    const TimePoint t0 = Clock::now();
    EXPECT_EQ(scheduler.submit(record_of(EventKind::Motion), t0).outcome, SubmitOutcome::Accepted);
    SubmitResult second = scheduler.submit(record_of(EventKind::Face), t0 + seconds(1));
    EXPECT_EQ(second.outcome, SubmitOutcome::Rejected);
    EXPECT_EQ(scheduler.rejected(), 1u);
    EXPECT_EQ(scheduler.pending(), 1u);

    // Never started: nothing reaches the store.
    scheduler.stop(false);
}

TEST(UploadSchedulerTest, FailedUploadIsDroppedNotRetried) {
    MockEventStore store;
    EXPECT_CALL(store, save_event(::testing::_))
        .Times(1)
        .WillOnce(::testing::Return(SaveResult::failure("backend unavailable")));

    UploadScheduler scheduler(store, milliseconds(10), 4);
    scheduler.start();
    EXPECT_EQ(scheduler.submit(record_of(EventKind::Motion), Clock::now()).outcome, SubmitOutcome::Accepted);
    scheduler.stop(true);

    EXPECT_EQ(scheduler.failed(), 1u);
    EXPECT_EQ(scheduler.uploaded(), 0u);
}

TEST(UploadSchedulerTest, StopWithoutDrainAbandonsDeferredWork) {
    RecordingEventStore store;
    UploadScheduler scheduler(store, Seconds(30), 4);
    scheduler.start();

    const TimePoint t0 = Clock::now();
    scheduler.submit(record_of(EventKind::Motion), t0);
    SubmitResult deferred = scheduler.submit(record_of(EventKind::Motion), t0 + milliseconds(1));
    EXPECT_EQ(deferred.outcome, SubmitOutcome::Deferred);

    // Give the worker time to run the first upload and start waiting.
    for (int i = 0; i < 100 && store.started().empty(); ++i) {
        std::this_thread::sleep_for(milliseconds(5));
    }
    const TimePoint stop_at = Clock::now();
    scheduler.stop(false);

    EXPECT_LT(Clock::now() - stop_at, seconds(5));
    EXPECT_EQ(store.records().size(), 1u);
}

TEST(UploadSchedulerTest, UploadStatusReflectsReservations) {
    RecordingEventStore store;
    UploadScheduler scheduler(store, Seconds(30), 4);
    const TimePoint t0 = Clock::now();
    EXPECT_TRUE(scheduler.upload_status(t0).can_upload_now);

    scheduler.submit(record_of(EventKind::Face), t0);
    UploadStatus st = scheduler.upload_status(t0 + seconds(5));
    EXPECT_FALSE(st.can_upload_now);
    EXPECT_NEAR(st.remaining_delay.count(), 25.0, 1e-6);
    scheduler.stop(false);
}
