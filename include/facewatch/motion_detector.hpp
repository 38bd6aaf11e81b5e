#pragma once

#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/video/background_segm.hpp>

#include "facewatch/frame_types.hpp"

namespace facewatch {

struct MotionParams {
    double min_motion_area{200.0};
    double aggregate_area{1000.0};  // summed foreground area that flags motion on its own
    double sensitivity{30.0};       // frame-difference binarization threshold
    int bg_history{500};
    double bg_var_threshold{16.0};
    bool detect_shadows{true};
    Seconds display_duration{3.0};
    bool overlay_enabled{true};
};

// Per-tick signals of both methods.
struct MotionAnalysis {
    bool background_motion{false};   // a foreground contour exceeded min_motion_area
    bool aggregate_motion{false};    // summed foreground area exceeded aggregate_area
    bool difference_motion{false};   // a frame-difference contour exceeded min_motion_area
    double significant_area{0.0};    // sum of foreground contours above min_motion_area
    double foreground_area{0.0};     // sum of all foreground contours
    double largest_difference_area{0.0};

    bool motion() const { return background_motion || aggregate_motion || difference_motion; }
    double event_area() const { return significant_area > 0.0 ? significant_area : foreground_area; }
};

MotionAnalysis evaluate_motion(const std::vector<double>& foreground_areas,
                               const std::vector<double>& difference_areas,
                               const MotionParams& params);

// Linear map of area to percent; an area of 1000 px is 100%.
double motion_confidence(double area);

struct MotionResult {
    cv::Mat frame;                     // annotated in place
    std::optional<MotionEvent> event;  // set only when this tick saw motion
    MotionAnalysis analysis;
    bool ok{true};
    std::string error;
};

// Stateful dual-method motion classifier. Owned by the producer loop; not
// safe for concurrent use.
class MotionDetector {
public:
    explicit MotionDetector(const MotionParams& params);

    MotionResult process(const Frame& frame);

    bool display_active() const { return display_active_; }
    const MotionParams& params() const { return params_; }

private:
    std::vector<double> foreground_contour_areas(const cv::Mat& frame);
    std::vector<double> difference_contour_areas(const cv::Mat& gray);
    void update_display(bool motion, TimePoint now);
    void draw_overlay(cv::Mat& frame) const;

    MotionParams params_;
    cv::Ptr<cv::BackgroundSubtractorMOG2> background_;
    cv::Mat kernel_;
    cv::Mat previous_gray_;
    bool display_active_{false};
    TimePoint last_motion_{};
};

}  // namespace facewatch
