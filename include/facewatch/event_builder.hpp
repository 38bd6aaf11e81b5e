#pragma once

#include <string>

#include <opencv2/core.hpp>

#include "facewatch/event_store.hpp"
#include "facewatch/frame_types.hpp"
#include "facewatch/motion_detector.hpp"

namespace facewatch {

// Turns detections into persistable records: JPEG-encodes the annotated
// frame, renders the JSON payload, and keeps a local copy of the capture.
class EventBuilder {
public:
    EventBuilder(DeviceIdentity device, std::string captures_dir, int jpeg_quality = 90);

    EventRecord motion_record(const MotionEvent& ev, const cv::Mat& frame, const MotionParams& params) const;
    EventRecord face_record(const FaceEvent& ev, const cv::Mat& frame) const;

    const DeviceIdentity& device() const { return device_; }

private:
    EmbeddedImage encode(const cv::Mat& frame) const;
    // Returns the written path, empty when nothing was kept.
    std::string save_capture(const std::string& filename, const EmbeddedImage& jpeg) const;

    DeviceIdentity device_;
    std::string captures_dir_;
    int jpeg_quality_;
};

std::string motion_payload(const MotionEvent& ev, const MotionParams& params, const std::string& timestamp);
std::string face_payload(const FaceEvent& ev, const std::string& timestamp);

}  // namespace facewatch
