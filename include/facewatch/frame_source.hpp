#pragma once

#include <optional>
#include <string>

#include <opencv2/videoio.hpp>

#include "facewatch/frame_types.hpp"

namespace facewatch {

// Supplies frames on demand. An empty result means the source is currently
// unavailable; callers retry later.
class FrameSource {
public:
    virtual ~FrameSource() = default;
    virtual std::optional<Frame> next_frame() = 0;
};

struct CameraSettings {
    std::string source{"0"};  // camera index or URL
    int width{640};
    int height{480};
    int fps{30};
};

// cv::VideoCapture with an explicit open/configure/start/stop/close
// lifecycle. A started camera that drops out is reopened on demand.
class CameraSource : public FrameSource {
public:
    enum class State { Closed, Opened, Configured, Started, Stopped };

    explicit CameraSource(const CameraSettings& settings);
    ~CameraSource() override;

    bool open();
    void configure();
    void start();
    void stop();
    void close();

    State state() const { return state_; }
    bool is_open() const { return cap_.isOpened(); }

    std::optional<Frame> next_frame() override;

private:
    bool reopen();

    CameraSettings settings_;
    cv::VideoCapture cap_;
    State state_{State::Closed};
    uint64_t sequence_{0};
};

}  // namespace facewatch
