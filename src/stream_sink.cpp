#include "facewatch/stream_sink.hpp"

#include <iostream>

#include <opencv2/imgcodecs.hpp>

namespace facewatch {

std::string mjpeg_part(const std::vector<uint8_t>& jpeg) {
    std::string part;
    part.reserve(jpeg.size() + 96);
    part += "--";
    part += kMjpegBoundary;
    part += "\r\nContent-Type: image/jpeg\r\nContent-Length: ";
    part += std::to_string(jpeg.size());
    part += "\r\n\r\n";
    part.append(reinterpret_cast<const char*>(jpeg.data()), jpeg.size());
    part += "\r\n";
    return part;
}

StreamSink::StreamSink(const FrameBuffer& buffer, std::chrono::milliseconds interval, int jpeg_quality)
    : buffer_(buffer), interval_(interval), jpeg_quality_(jpeg_quality) {}

std::optional<std::string> StreamSink::next_part() {
    std::optional<Frame> frame = buffer_.read();
    if (!frame || frame->image.empty()) return std::nullopt;

    std::vector<uint8_t> jpeg;
    try {
        std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, jpeg_quality_};
        if (!cv::imencode(".jpg", frame->image, jpeg, params)) return std::nullopt;
    } catch (const cv::Exception& e) {
        std::cerr << "[http] frame encoding failed: " << e.what() << std::endl;
        return std::nullopt;
    }
    return mjpeg_part(jpeg);
}

bool StreamSlots::try_acquire() {
    size_t cur = active_.load();
    while (cur < capacity_) {
        if (active_.compare_exchange_weak(cur, cur + 1)) return true;
    }
    return false;
}

void StreamSlots::release() {
    size_t cur = active_.load();
    while (cur > 0 && !active_.compare_exchange_weak(cur, cur - 1)) {
    }
}

}  // namespace facewatch
