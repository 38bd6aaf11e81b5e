#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <opencv2/core.hpp>

#include "facewatch/event_store.hpp"
#include "facewatch/face_analyzer.hpp"
#include "facewatch/frame_source.hpp"

namespace facewatch {
namespace testing_util {

class RecordingEventStore : public EventStore {
public:
    SaveResult save_event(const EventRecord& record) override {
        std::lock_guard<std::mutex> lock(mu_);
        records_.push_back(record);
        started_.push_back(Clock::now());
        return SaveResult::success("evt-" + std::to_string(records_.size()));
    }

    std::vector<EventRecord> records() const {
        std::lock_guard<std::mutex> lock(mu_);
        return records_;
    }

    std::vector<TimePoint> started() const {
        std::lock_guard<std::mutex> lock(mu_);
        return started_;
    }

private:
    mutable std::mutex mu_;
    std::vector<EventRecord> records_;
    std::vector<TimePoint> started_;
};

class MockEventStore : public EventStore {
public:
    MOCK_METHOD(SaveResult, save_event, (const EventRecord& record), (override));
};

class FakeFaceAnalyzer : public FaceAnalyzer {
public:
    std::vector<DetectedFace> analyze(const cv::Mat&) override {
        calls++;
        if (throw_error) {
            throw cv::Exception(cv::Error::StsError, "synthetic failure", "analyze", __FILE__, __LINE__);
        }
        return faces;
    }

    std::vector<DetectedFace> faces;
    bool throw_error{false};
    std::atomic<int> calls{0};
};

class ScriptedFrameSource : public FrameSource {
public:
    void push(std::optional<Frame> frame) {
        std::lock_guard<std::mutex> lock(mu_);
        script_.push_back(std::move(frame));
    }

    std::optional<Frame> next_frame() override {
        std::lock_guard<std::mutex> lock(mu_);
        requests++;
        if (script_.empty()) return std::nullopt;
        std::optional<Frame> f = std::move(script_.front());
        script_.pop_front();
        return f;
    }

    std::atomic<int> requests{0};

private:
    std::mutex mu_;
    std::deque<std::optional<Frame>> script_;
};

inline cv::Mat embedding(std::initializer_list<float> values) {
    cv::Mat m(1, static_cast<int>(values.size()), CV_32F);
    int i = 0;
    for (float v : values) m.at<float>(0, i++) = v;
    return m;
}

inline cv::Mat embedding64(std::initializer_list<double> values) {
    cv::Mat m(1, static_cast<int>(values.size()), CV_64F);
    int i = 0;
    for (double v : values) m.at<double>(0, i++) = v;
    return m;
}

inline Frame solid_frame(uint64_t seq, TimePoint at, uchar value = 20, cv::Size size = cv::Size(320, 240)) {
    Frame f;
    f.image = cv::Mat(size, CV_8UC3, cv::Scalar(value, value, value));
    f.captured_at = at;
    f.sequence = seq;
    return f;
}

inline std::filesystem::path make_temp_dir(const std::string& prefix) {
    std::random_device rd;
    auto dir = std::filesystem::temp_directory_path() /
               (prefix + "_" + std::to_string(rd()) + std::to_string(rd()));
    std::filesystem::create_directories(dir);
    return dir;
}

}  // namespace testing_util
}  // namespace facewatch
