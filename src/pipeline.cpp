#include "facewatch/pipeline.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace facewatch {

Pipeline::Pipeline(FrameSource& source,
                   MotionDetector& motion,
                   FaceMatcher& faces,
                   EmissionController& emitter,
                   const EventBuilder& builder,
                   FrameBuffer& buffer,
                   const PipelineParams& params)
    : source_(source),
      motion_(motion),
      faces_(faces),
      emitter_(emitter),
      builder_(builder),
      buffer_(buffer),
      params_(params) {}

Pipeline::~Pipeline() {
    stop();
}

void Pipeline::start() {
    if (running_) return;
    running_ = true;
    started_ = Clock::now();
    worker_ = std::thread(&Pipeline::run, this);
}

void Pipeline::stop() {
    {
        std::lock_guard<std::mutex> lock(sleep_mu_);
        if (!running_) return;
        running_ = false;
    }
    sleep_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

std::chrono::milliseconds Pipeline::backoff_for(int failures, const PipelineParams& params) {
    if (failures <= 0) return std::chrono::milliseconds(0);
    auto d = params.min_backoff;
    for (int i = 1; i < failures && d < params.max_backoff; ++i) {
        d *= 2;
    }
    return std::min(d, params.max_backoff);
}

bool Pipeline::sleep_for(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lock(sleep_mu_);
    return !sleep_cv_.wait_for(lock, d, [&] { return !running_; });
}

TickOutcome Pipeline::tick() {
    std::optional<Frame> frame = source_.next_frame();
    if (!frame) {
        unavailable_++;
        return TickOutcome::SourceUnavailable;
    }
    frames_++;
    const TimePoint now = frame->captured_at;

    MotionResult m = motion_.process(*frame);
    if (!m.ok) detection_errors_++;
    if (m.event) {
        const MotionEvent ev = *m.event;
        const cv::Mat annotated = m.frame;
        ProposalResult r = emitter_.propose(EventKind::Motion, now, [&] {
            return builder_.motion_record(ev, annotated, motion_.params());
        });
        if (r.outcome == Proposal::Submitted) {
            motion_events_++;
            std::cout << "[motion] Motion event submitted (Area: " << ev.total_area
                      << ", Confidence: " << ev.confidence << "%)\n";
        }
    }

    Frame motion_frame{m.frame, frame->captured_at, frame->sequence};
    FaceResult f = faces_.process(motion_frame);
    if (!f.ok) detection_errors_++;
    for (const auto& ev : f.events) {
        ProposalResult r = emitter_.propose(EventKind::Face, now, [&] {
            return builder_.face_record(ev, f.frame);
        });
        if (r.outcome == Proposal::Submitted) {
            face_events_++;
            std::cout << "[face] Face event submitted: " << ev.identity
                      << " (Confidence: " << ev.confidence << "%)\n";
        }
    }

    buffer_.write(Frame{f.frame, frame->captured_at, frame->sequence});
    return TickOutcome::Processed;
}

void Pipeline::run() {
    const auto frame_period = params_.target_fps > 0
        ? std::chrono::milliseconds(1000 / params_.target_fps)
        : std::chrono::milliseconds(0);
    int failures = 0;

    while (running_) {
        const TimePoint tick_start = Clock::now();
        TickOutcome outcome = TickOutcome::SourceUnavailable;
        try {
            outcome = tick();
        } catch (const std::exception& e) {
            // Nothing inside a tick may end the producer loop.
            detection_errors_++;
            std::cerr << "[ERROR] Error processing frame: " << e.what() << std::endl;
        }

        if (outcome == TickOutcome::SourceUnavailable) {
            failures++;
            if (failures == 1) {
                std::cerr << "[WARN] Frame source unavailable, backing off" << std::endl;
            }
            if (!sleep_for(backoff_for(failures, params_))) break;
            continue;
        }
        if (failures > 0) {
            std::cout << "[INFO] Frame source recovered after " << failures << " attempt(s)\n";
            failures = 0;
        }

        const auto elapsed = Clock::now() - tick_start;
        if (elapsed < frame_period) {
            if (!sleep_for(std::chrono::duration_cast<std::chrono::milliseconds>(frame_period - elapsed))) break;
        }
    }
}

PipelineStats Pipeline::stats() const {
    PipelineStats st;
    st.running = running_;
    if (st.running) {
        st.uptime_sec = Seconds(Clock::now() - started_).count();
    }
    st.frames = frames_;
    st.source_unavailable = unavailable_;
    st.detection_errors = detection_errors_;
    st.motion_events = motion_events_;
    st.face_events = face_events_;
    return st;
}

}  // namespace facewatch
