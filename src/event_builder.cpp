#include "facewatch/event_builder.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

#include <opencv2/imgcodecs.hpp>

#include "facewatch/json_util.hpp"

namespace facewatch {

static std::string file_safe(const std::string& name) {
    std::string out = name;
    for (char& ch : out) {
        if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '-') ch = '_';
    }
    return out;
}

std::string motion_payload(const MotionEvent& ev, const MotionParams& params, const std::string& timestamp) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    oss << "{";
    oss << "\"motion_area\":" << ev.total_area << ",";
    oss << "\"timestamp\":\"" << json_escape(timestamp) << "\",";
    oss << "\"sensitivity\":" << params.sensitivity << ",";
    oss << "\"min_area\":" << params.min_motion_area;
    oss << "}";
    return oss.str();
}

std::string face_payload(const FaceEvent& ev, const std::string& timestamp) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    oss << "{";
    oss << "\"name\":\"" << json_escape(ev.identity) << "\",";
    oss << "\"confidence\":" << ev.confidence << ",";
    oss << "\"timestamp\":\"" << json_escape(timestamp) << "\",";
    oss << "\"face_location\":[" << ev.box.x << "," << ev.box.y << ","
        << ev.box.x + ev.box.width << "," << ev.box.y + ev.box.height << "],";
    oss << "\"recognition_type\":\"" << (ev.known() ? "known" : "unknown") << "\"";
    oss << "}";
    return oss.str();
}

EventBuilder::EventBuilder(DeviceIdentity device, std::string captures_dir, int jpeg_quality)
    : device_(std::move(device)), captures_dir_(std::move(captures_dir)), jpeg_quality_(jpeg_quality) {}

EmbeddedImage EventBuilder::encode(const cv::Mat& frame) const {
    EmbeddedImage img;
    if (frame.empty()) return img;
    try {
        std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, jpeg_quality_};
        cv::imencode(".jpg", frame, img.bytes, params);
    } catch (const cv::Exception& e) {
        std::cerr << "[WARN] JPEG encoding failed: " << e.what() << std::endl;
        img.bytes.clear();
    }
    return img;
}

std::string EventBuilder::save_capture(const std::string& filename, const EmbeddedImage& jpeg) const {
    if (captures_dir_.empty() || jpeg.bytes.empty()) return {};
    std::error_code ec;
    std::filesystem::create_directories(captures_dir_, ec);
    if (ec) {
        std::cerr << "[WARN] Unable to create captures directory " << captures_dir_ << ": "
                  << ec.message() << std::endl;
        return {};
    }
    const auto path = std::filesystem::path(captures_dir_) / filename;
    std::ofstream f(path, std::ios::binary);
    if (!f) {
        std::cerr << "[WARN] Unable to write capture: " << path.string() << std::endl;
        return {};
    }
    f.write(reinterpret_cast<const char*>(jpeg.bytes.data()), static_cast<std::streamsize>(jpeg.bytes.size()));
    if (!f) {
        std::cerr << "[WARN] Short write on capture: " << path.string() << std::endl;
        return {};
    }
    return path.string();
}

EventRecord EventBuilder::motion_record(const MotionEvent& ev, const cv::Mat& frame,
                                        const MotionParams& params) const {
    EventRecord rec;
    rec.kind = EventKind::Motion;
    rec.created_at = std::chrono::system_clock::now();
    const std::string stamp = compact_local_timestamp(rec.created_at);
    rec.payload = motion_payload(ev, params, stamp);
    rec.confidence = ev.confidence;
    rec.device = device_;

    EmbeddedImage jpeg = encode(frame);
    rec.capture_file = save_capture("motion_" + stamp + ".jpg", jpeg);
    rec.image = std::move(jpeg);
    return rec;
}

EventRecord EventBuilder::face_record(const FaceEvent& ev, const cv::Mat& frame) const {
    EventRecord rec;
    rec.kind = EventKind::Face;
    rec.created_at = std::chrono::system_clock::now();
    const std::string stamp = compact_local_timestamp(rec.created_at);
    rec.payload = face_payload(ev, stamp);
    rec.confidence = ev.confidence;
    rec.device = device_;

    EmbeddedImage jpeg = encode(frame);
    rec.capture_file = save_capture("face_" + file_safe(ev.identity) + "_" + stamp + ".jpg", jpeg);
    rec.image = std::move(jpeg);
    return rec;
}

}  // namespace facewatch
