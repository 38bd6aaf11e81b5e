#include "facewatch/frame_source.hpp"

#include <exception>
#include <iostream>

#include <opencv2/imgproc.hpp>

namespace facewatch {

CameraSource::CameraSource(const CameraSettings& settings) : settings_(settings) {}

CameraSource::~CameraSource() {
    close();
}

bool CameraSource::open() {
    if (cap_.isOpened()) return true;

    // Allow numeric index or URL
    bool numeric = !settings_.source.empty() &&
                   settings_.source.find_first_not_of("0123456789") == std::string::npos;
    try {
        if (numeric) {
            cap_.open(std::stoi(settings_.source));
        } else {
            cap_.open(settings_.source);
        }
    } catch (const std::exception& e) {
        std::cerr << "[camera] open failed: " << e.what() << std::endl;
    }

    if (!cap_.isOpened()) {
        std::cerr << "[ERROR] Unable to open video source: " << settings_.source << std::endl;
        return false;
    }
    state_ = State::Opened;
    std::cout << "[camera] opened " << settings_.source << "\n";
    return true;
}

void CameraSource::configure() {
    if (!cap_.isOpened()) return;
    cap_.set(cv::CAP_PROP_FRAME_WIDTH, settings_.width);
    cap_.set(cv::CAP_PROP_FRAME_HEIGHT, settings_.height);
    if (settings_.fps > 0) {
        cap_.set(cv::CAP_PROP_FPS, settings_.fps);
    }
    state_ = State::Configured;
}

void CameraSource::start() {
    state_ = State::Started;
}

void CameraSource::stop() {
    if (state_ == State::Started) state_ = State::Stopped;
}

void CameraSource::close() {
    if (cap_.isOpened()) {
        cap_.release();
        std::cout << "[camera] released " << settings_.source << "\n";
    }
    state_ = State::Closed;
}

bool CameraSource::reopen() {
    cap_.release();
    if (!open()) return false;
    configure();
    state_ = State::Started;
    return true;
}

std::optional<Frame> CameraSource::next_frame() {
    if (state_ != State::Started) return std::nullopt;
    if (!cap_.isOpened() && !reopen()) return std::nullopt;

    cv::Mat image;
    try {
        if (!cap_.read(image) || image.empty()) {
            std::cerr << "[WARN] Capture read failed, retrying..." << std::endl;
            return std::nullopt;
        }
    } catch (const cv::Exception& e) {
        std::cerr << "[camera] read failed: " << e.what() << std::endl;
        cap_.release();
        return std::nullopt;
    }

    // Keep the negotiated resolution even if the device ignored the request.
    if (image.cols != settings_.width || image.rows != settings_.height) {
        cv::resize(image, image, cv::Size(settings_.width, settings_.height));
    }

    Frame frame;
    frame.image = image;
    frame.captured_at = Clock::now();
    frame.sequence = ++sequence_;
    return frame;
}

}  // namespace facewatch
