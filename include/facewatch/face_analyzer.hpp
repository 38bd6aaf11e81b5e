#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/objdetect.hpp>

namespace facewatch {

struct DetectedFace {
    cv::Rect box;
    float score{0.0f};
    cv::Mat embedding;  // 1 x N unit row
};

// Locates faces in a BGR image and computes one embedding per face.
class FaceAnalyzer {
public:
    virtual ~FaceAnalyzer() = default;
    virtual std::vector<DetectedFace> analyze(const cv::Mat& bgr) = 0;
};

// YuNet detector + SFace recognizer, both run through OpenCV DNN.
class OpenCvFaceAnalyzer : public FaceAnalyzer {
public:
    OpenCvFaceAnalyzer(const std::string& detector_model,
                       const std::string& recognizer_model,
                       float score_threshold = 0.9f,
                       float nms_threshold = 0.3f);

    bool ready() const { return ready_; }

    std::vector<DetectedFace> analyze(const cv::Mat& bgr) override;

private:
    cv::Ptr<cv::FaceDetectorYN> detector_;
    cv::Ptr<cv::FaceRecognizerSF> recognizer_;
    cv::Size input_size_;
    bool ready_{false};
};

}  // namespace facewatch
