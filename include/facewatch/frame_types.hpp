#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <opencv2/core.hpp>

namespace facewatch {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Seconds = std::chrono::duration<double>;

enum class EventKind { Motion, Face };

inline const char* event_kind_to_string(EventKind kind) {
    switch (kind) {
        case EventKind::Face: return "face";
        default: return "motion";
    }
}

struct Frame {
    cv::Mat image;            // BGR image
    TimePoint captured_at{};  // monotonic capture time
    uint64_t sequence{0};
};

struct MotionEvent {
    double total_area{0.0};
    double confidence{0.0};   // percent, [0, 100]
    TimePoint timestamp{};
};

inline constexpr const char* kUnknownIdentity = "Unknown";

struct FaceEvent {
    std::string identity{kUnknownIdentity};
    double confidence{0.0};   // percent
    cv::Rect box;
    TimePoint timestamp{};

    bool known() const { return identity != kUnknownIdentity; }
};

struct DeviceIdentity {
    std::string serial;
    std::string model;
};

// Image attached to a persisted event. The representation is fixed when the
// event is built and never re-inspected downstream.
struct EmbeddedImage {
    std::vector<uint8_t> bytes;
    std::string mime_type{"image/jpeg"};
};

struct RemoteImage {
    std::string url;
};

using ImagePayload = std::variant<EmbeddedImage, RemoteImage>;

}  // namespace facewatch
