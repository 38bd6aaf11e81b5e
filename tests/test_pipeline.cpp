#include <gtest/gtest.h>

#include <memory>
#include <thread>

#include "facewatch/pipeline.hpp"
#include "test_helpers.hpp"

using namespace facewatch;
using std::chrono::milliseconds;
using testing_util::FakeFaceAnalyzer;
using testing_util::RecordingEventStore;
using testing_util::ScriptedFrameSource;

namespace {

class PipelineTest : public ::testing::Test {
protected:
    PipelineTest()
        : analyzer_(std::make_shared<FakeFaceAnalyzer>()),
          motion_(MotionParams{}),
          faces_(make_gallery(), analyzer_, MatchParams{}),
          cooldown_(Seconds(30), Seconds(30)),
          scheduler_(store_, Seconds(0), 16),
          emitter_(cooldown_, scheduler_),
          builder_(DeviceIdentity{"SN1", "RPI3"}, ""),
          pipeline_(source_, motion_, faces_, emitter_, builder_, buffer_, PipelineParams{}) {}

    static std::shared_ptr<const Gallery> make_gallery() {
        auto g = std::make_shared<Gallery>();
        g->add("alice", testing_util::embedding({1.0f, 0.0f, 0.0f}));
        return g;
    }

    DetectedFace alice_face() const {
        DetectedFace f;
        f.box = cv::Rect(40, 40, 60, 60);
        f.score = 0.95f;
        f.embedding = testing_util::embedding({1.0f, 0.0f, 0.0f});
        return f;
    }

    ScriptedFrameSource source_;
    std::shared_ptr<FakeFaceAnalyzer> analyzer_;
    MotionDetector motion_;
    FaceMatcher faces_;
    RecordingEventStore store_;
    CooldownGate cooldown_;
    UploadScheduler scheduler_;
    EmissionController emitter_;
    EventBuilder builder_;
    FrameBuffer buffer_;
    Pipeline pipeline_;
};

}  // namespace

TEST_F(PipelineTest, UnavailableSourceLeavesBufferEmpty) {
    EXPECT_EQ(pipeline_.tick(), TickOutcome::SourceUnavailable);
    EXPECT_FALSE(buffer_.read().has_value());
    EXPECT_EQ(pipeline_.stats().source_unavailable, 1u);
    EXPECT_EQ(pipeline_.stats().frames, 0u);
}

TEST_F(PipelineTest, ProcessedFrameReachesBuffer) {
    source_.push(testing_util::solid_frame(7, Clock::now()));
    EXPECT_EQ(pipeline_.tick(), TickOutcome::Processed);

    auto latest = buffer_.read();
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->sequence, 7u);
    EXPECT_EQ(latest->image.size(), cv::Size(320, 240));
    EXPECT_EQ(pipeline_.stats().frames, 1u);
}

TEST_F(PipelineTest, RecognisedFaceBecomesFaceEvent) {
    analyzer_->faces = {alice_face()};
    scheduler_.start();
    source_.push(testing_util::solid_frame(1, Clock::now()));
    ASSERT_EQ(pipeline_.tick(), TickOutcome::Processed);
    scheduler_.stop(true);

    EXPECT_EQ(pipeline_.stats().face_events, 1u);
    bool saw_face = false;
    for (const auto& rec : store_.records()) {
        if (rec.kind != EventKind::Face) continue;
        saw_face = true;
        EXPECT_NE(rec.payload.find("\"name\":\"alice\""), std::string::npos);
        EXPECT_DOUBLE_EQ(rec.confidence, 100.0);
    }
    EXPECT_TRUE(saw_face);
}

TEST_F(PipelineTest, FaceCooldownSuppressesRepeats) {
    analyzer_->faces = {alice_face()};
    const TimePoint t0 = Clock::now();
    source_.push(testing_util::solid_frame(1, t0));
    source_.push(testing_util::solid_frame(2, t0 + milliseconds(500)));
    pipeline_.tick();
    pipeline_.tick();
    EXPECT_EQ(pipeline_.stats().face_events, 1u);
}

TEST_F(PipelineTest, DetectorFailureStillPublishesFrame) {
    analyzer_->throw_error = true;
    source_.push(testing_util::solid_frame(3, Clock::now()));
    EXPECT_EQ(pipeline_.tick(), TickOutcome::Processed);

    auto latest = buffer_.read();
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->sequence, 3u);
    EXPECT_EQ(pipeline_.stats().detection_errors, 1u);
    EXPECT_EQ(pipeline_.stats().face_events, 0u);
}

TEST(PipelineBackoffTest, DoublesUpToCeiling) {
    PipelineParams p;
    EXPECT_EQ(Pipeline::backoff_for(0, p), milliseconds(0));
    EXPECT_EQ(Pipeline::backoff_for(1, p), milliseconds(100));
    EXPECT_EQ(Pipeline::backoff_for(2, p), milliseconds(200));
    EXPECT_EQ(Pipeline::backoff_for(3, p), milliseconds(400));
    EXPECT_EQ(Pipeline::backoff_for(6, p), milliseconds(2000));
    EXPECT_EQ(Pipeline::backoff_for(50, p), milliseconds(2000));
}

TEST_F(PipelineTest, LoopKeepsRetryingDeadSource) {
    pipeline_.start();
    EXPECT_TRUE(pipeline_.running());
    std::this_thread::sleep_for(milliseconds(250));
    pipeline_.stop();

    EXPECT_FALSE(pipeline_.running());
    EXPECT_GE(source_.requests.load(), 2);
    EXPECT_FALSE(buffer_.read().has_value());
}
