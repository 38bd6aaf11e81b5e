#include "facewatch/face_analyzer.hpp"

#include <filesystem>
#include <iostream>

#include "facewatch/gallery.hpp"

namespace facewatch {

OpenCvFaceAnalyzer::OpenCvFaceAnalyzer(const std::string& detector_model,
                                       const std::string& recognizer_model,
                                       float score_threshold,
                                       float nms_threshold) {
    if (!std::filesystem::exists(detector_model)) {
        std::cerr << "[face] Face detection model not found: " << detector_model << std::endl;
        return;
    }
    if (!std::filesystem::exists(recognizer_model)) {
        std::cerr << "[face] Face recognition model not found: " << recognizer_model << std::endl;
        return;
    }

    try {
        input_size_ = cv::Size(320, 320);
        detector_ = cv::FaceDetectorYN::create(detector_model, "", input_size_,
                                               score_threshold, nms_threshold);
        recognizer_ = cv::FaceRecognizerSF::create(recognizer_model, "");
    } catch (const cv::Exception& e) {
        std::cerr << "[face] Failed to load face models: " << e.what() << std::endl;
        detector_.release();
        recognizer_.release();
        return;
    }

    ready_ = !detector_.empty() && !recognizer_.empty();
    if (ready_) {
        std::cout << "[face] Models loaded: " << detector_model << ", " << recognizer_model << "\n";
    }
}

std::vector<DetectedFace> OpenCvFaceAnalyzer::analyze(const cv::Mat& bgr) {
    std::vector<DetectedFace> out;
    if (!ready_ || bgr.empty()) return out;

    if (bgr.size() != input_size_) {
        input_size_ = bgr.size();
        detector_->setInputSize(input_size_);
    }

    // One row per face: x, y, w, h, five landmarks, score.
    cv::Mat faces;
    detector_->detect(bgr, faces);
    const cv::Rect bounds(0, 0, bgr.cols, bgr.rows);

    for (int i = 0; i < faces.rows; ++i) {
        cv::Mat aligned;
        recognizer_->alignCrop(bgr, faces.row(i), aligned);
        cv::Mat feature;
        recognizer_->feature(aligned, feature);

        DetectedFace face;
        face.box = cv::Rect(static_cast<int>(faces.at<float>(i, 0)),
                            static_cast<int>(faces.at<float>(i, 1)),
                            static_cast<int>(faces.at<float>(i, 2)),
                            static_cast<int>(faces.at<float>(i, 3))) & bounds;
        face.score = faces.at<float>(i, 14);
        face.embedding = unit_embedding(feature);
        out.push_back(face);
    }
    return out;
}

}  // namespace facewatch
