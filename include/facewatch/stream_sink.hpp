#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "facewatch/frame_buffer.hpp"

namespace facewatch {

inline constexpr const char* kMjpegBoundary = "frame";

// Encodes one multipart/x-mixed-replace part around a JPEG image.
std::string mjpeg_part(const std::vector<uint8_t>& jpeg);

// One per live stream connection. Reads the latest frame from the buffer on
// each tick and produces an independently encoded JPEG part.
class StreamSink {
public:
    explicit StreamSink(const FrameBuffer& buffer,
                        std::chrono::milliseconds interval = std::chrono::milliseconds(33),
                        int jpeg_quality = 80);

    // Empty when nothing has been written yet or encoding failed.
    std::optional<std::string> next_part();

    std::chrono::milliseconds interval() const { return interval_; }

private:
    const FrameBuffer& buffer_;
    std::chrono::milliseconds interval_;
    int jpeg_quality_;
};

// Counts live stream connections so they cannot take every HTTP worker.
class StreamSlots {
public:
    explicit StreamSlots(size_t capacity) : capacity_(capacity) {}

    bool try_acquire();
    void release();

    size_t active() const { return active_.load(); }
    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    std::atomic<size_t> active_{0};
};

}  // namespace facewatch
