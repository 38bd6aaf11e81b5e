#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#include "facewatch/emission_controller.hpp"
#include "facewatch/event_builder.hpp"
#include "facewatch/face_matcher.hpp"
#include "facewatch/frame_buffer.hpp"
#include "facewatch/frame_source.hpp"
#include "facewatch/motion_detector.hpp"

namespace facewatch {

struct PipelineParams {
    int target_fps{30};
    std::chrono::milliseconds min_backoff{100};
    std::chrono::milliseconds max_backoff{2000};
};

enum class TickOutcome { Processed, SourceUnavailable };

struct PipelineStats {
    bool running{false};
    double uptime_sec{0.0};
    uint64_t frames{0};
    uint64_t source_unavailable{0};
    uint64_t detection_errors{0};
    uint64_t motion_events{0};
    uint64_t face_events{0};
};

// The single producer: FrameSource -> MotionDetector -> FaceMatcher ->
// FrameBuffer, with detections offered to the EmissionController.
class Pipeline {
public:
    Pipeline(FrameSource& source,
             MotionDetector& motion,
             FaceMatcher& faces,
             EmissionController& emitter,
             const EventBuilder& builder,
             FrameBuffer& buffer,
             const PipelineParams& params);
    ~Pipeline();

    void start();
    void stop();
    bool running() const { return running_; }

    // One producer iteration; also used directly by tests.
    TickOutcome tick();

    PipelineStats stats() const;

    // Delay before the next attempt after `failures` consecutive unavailable ticks.
    static std::chrono::milliseconds backoff_for(int failures, const PipelineParams& params);

private:
    void run();
    bool sleep_for(std::chrono::milliseconds d);

    FrameSource& source_;
    MotionDetector& motion_;
    FaceMatcher& faces_;
    EmissionController& emitter_;
    const EventBuilder& builder_;
    FrameBuffer& buffer_;
    PipelineParams params_;

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::mutex sleep_mu_;
    std::condition_variable sleep_cv_;
    TimePoint started_{};

    std::atomic<uint64_t> frames_{0};
    std::atomic<uint64_t> unavailable_{0};
    std::atomic<uint64_t> detection_errors_{0};
    std::atomic<uint64_t> motion_events_{0};
    std::atomic<uint64_t> face_events_{0};
};

}  // namespace facewatch
