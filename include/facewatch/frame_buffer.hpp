#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>

#include "facewatch/frame_types.hpp"

namespace facewatch {

// Single-slot cache of the most recently processed frame. One exclusive
// writer, any number of shared readers; readers only ever see the latest
// complete frame, intermediate frames may be skipped.
class FrameBuffer {
public:
    // The written image must not be modified afterwards; readers share it.
    void write(Frame frame) {
        std::unique_lock<std::shared_mutex> lock(mu_);
        slot_ = std::move(frame);
        ++version_;
    }

    std::optional<Frame> read() const {
        std::shared_lock<std::shared_mutex> lock(mu_);
        return slot_;
    }

    uint64_t version() const {
        std::shared_lock<std::shared_mutex> lock(mu_);
        return version_;
    }

private:
    mutable std::shared_mutex mu_;
    std::optional<Frame> slot_;
    uint64_t version_{0};
};

}  // namespace facewatch
