#include "facewatch/motion_detector.hpp"

#include <algorithm>
#include <iostream>

#include <opencv2/imgproc.hpp>
#include <opencv2/video.hpp>

namespace facewatch {

static std::vector<double> contour_areas(const cv::Mat& binary) {
    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(binary, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
    std::vector<double> areas;
    areas.reserve(contours.size());
    for (const auto& c : contours) {
        areas.push_back(cv::contourArea(c));
    }
    return areas;
}

MotionAnalysis evaluate_motion(const std::vector<double>& foreground_areas,
                               const std::vector<double>& difference_areas,
                               const MotionParams& params) {
    MotionAnalysis a;
    for (double area : foreground_areas) {
        a.foreground_area += area;
        if (area > params.min_motion_area) {
            a.significant_area += area;
            a.background_motion = true;
        }
    }
    a.aggregate_motion = a.foreground_area > params.aggregate_area;

    for (double area : difference_areas) {
        a.largest_difference_area = std::max(a.largest_difference_area, area);
        if (area > params.min_motion_area) a.difference_motion = true;
    }
    return a;
}

double motion_confidence(double area) {
    return std::min(100.0, std::max(0.0, (area / 1000.0) * 100.0));
}

MotionDetector::MotionDetector(const MotionParams& params)
    : params_(params),
      background_(cv::createBackgroundSubtractorMOG2(params.bg_history, params.bg_var_threshold,
                                                     params.detect_shadows)),
      kernel_(cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(3, 3))) {}

std::vector<double> MotionDetector::foreground_contour_areas(const cv::Mat& frame) {
    cv::Mat mask;
    background_->apply(frame, mask);
    cv::morphologyEx(mask, mask, cv::MORPH_OPEN, kernel_);
    cv::morphologyEx(mask, mask, cv::MORPH_CLOSE, kernel_);
    return contour_areas(mask);
}

std::vector<double> MotionDetector::difference_contour_areas(const cv::Mat& gray) {
    if (previous_gray_.empty() || previous_gray_.size() != gray.size()) return {};
    cv::Mat diff;
    cv::absdiff(gray, previous_gray_, diff);
    cv::threshold(diff, diff, params_.sensitivity, 255, cv::THRESH_BINARY);
    return contour_areas(diff);
}

MotionResult MotionDetector::process(const Frame& frame) {
    MotionResult res;
    res.frame = frame.image;
    if (frame.image.empty()) {
        res.ok = false;
        res.error = "empty frame";
        return res;
    }

    const TimePoint now = frame.captured_at;
    bool motion = false;
    try {
        cv::Mat gray;
        if (frame.image.channels() == 1) {
            gray = frame.image.clone();
        } else {
            cv::cvtColor(frame.image, gray, cv::COLOR_BGR2GRAY);
        }

        std::vector<double> diff_areas = difference_contour_areas(gray);
        // Replaced every tick regardless of the outcome.
        previous_gray_ = gray;

        std::vector<double> fg_areas = foreground_contour_areas(frame.image);
        res.analysis = evaluate_motion(fg_areas, diff_areas, params_);
        motion = res.analysis.motion();
    } catch (const cv::Exception& e) {
        std::cerr << "[motion] analysis failed, treating tick as still: " << e.what() << std::endl;
        res.ok = false;
        res.error = e.what();
        res.analysis = MotionAnalysis{};
        motion = false;
    }

    update_display(motion, now);

    if (motion) {
        MotionEvent ev;
        ev.total_area = res.analysis.event_area();
        ev.confidence = motion_confidence(ev.total_area);
        ev.timestamp = now;
        res.event = ev;
    }

    // A failed tick hands the frame on unannotated.
    if (res.ok && params_.overlay_enabled && display_active_) {
        draw_overlay(res.frame);
    }
    return res;
}

void MotionDetector::update_display(bool motion, TimePoint now) {
    if (motion) {
        display_active_ = true;
        last_motion_ = now;
    } else if (display_active_ && now - last_motion_ > params_.display_duration) {
        display_active_ = false;
    }
}

void MotionDetector::draw_overlay(cv::Mat& frame) const {
    cv::putText(frame, "Motion", cv::Point(frame.cols - 120, 30),
                cv::FONT_HERSHEY_SIMPLEX, 1.0, cv::Scalar(0, 0, 255), 2);
}

}  // namespace facewatch
