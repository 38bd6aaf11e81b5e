#include "facewatch/face_matcher.hpp"

#include <exception>
#include <iostream>
#include <utility>

#include <opencv2/imgproc.hpp>

namespace facewatch {

double face_distance(const cv::Mat& a, const cv::Mat& b) {
    cv::Mat fa, fb;
    a.reshape(1, 1).convertTo(fa, CV_64F);
    b.reshape(1, 1).convertTo(fb, CV_64F);
    return cv::norm(fa, fb, cv::NORM_L2);
}

double confidence_from_distance(double distance) {
    return (1.0 - distance) * 100.0;
}

bool accepts_identity(double confidence, double min_confidence) {
    return confidence >= min_confidence;
}

FaceClassification classify_embedding(const cv::Mat& embedding,
                                      const Gallery& gallery,
                                      const MatchParams& params) {
    FaceClassification result;
    if (gallery.empty() || embedding.empty()) return result;

    const cv::Mat probe = embedding.reshape(1, 1);
    for (size_t i = 0; i < gallery.size(); ++i) {
        const cv::Mat& ref = gallery.at(i).embedding;
        if (ref.total() != probe.total()) continue;

        double d = face_distance(probe, ref);
        if (d > params.tolerance) continue;
        if (!result.matched || d < result.distance) {
            result.matched = true;
            result.distance = d;
            result.gallery_index = static_cast<int>(i);
        }
    }

    if (!result.matched) return result;

    result.confidence = confidence_from_distance(result.distance);
    if (accepts_identity(result.confidence, params.min_confidence)) {
        result.identity = gallery.at(result.gallery_index).name;
    }
    return result;
}

FaceMatcher::FaceMatcher(std::shared_ptr<const Gallery> gallery,
                         std::shared_ptr<FaceAnalyzer> analyzer,
                         const MatchParams& params)
    : gallery_(std::move(gallery)), analyzer_(std::move(analyzer)), params_(params) {}

void FaceMatcher::set_gallery(std::shared_ptr<const Gallery> gallery) {
    gallery_ = std::move(gallery);
}

bool FaceMatcher::enabled() const {
    return analyzer_ && gallery_ && !gallery_->empty();
}

FaceResult FaceMatcher::process(const Frame& frame) {
    FaceResult res;
    res.frame = frame.image;
    if (!enabled() || frame.image.empty()) return res;

    std::vector<DetectedFace> faces;
    try {
        faces = analyzer_->analyze(frame.image);
    } catch (const std::exception& e) {
        std::cerr << "[face] recognition failed for frame " << frame.sequence << ": " << e.what() << std::endl;
        res.ok = false;
        res.error = e.what();
        return res;
    }

    for (const auto& face : faces) {
        FaceClassification c = classify_embedding(face.embedding, *gallery_, params_);
        FaceEvent ev;
        ev.identity = c.identity;
        ev.confidence = c.confidence;
        ev.box = face.box;
        ev.timestamp = frame.captured_at;
        res.events.push_back(ev);
    }

    if (params_.overlay_enabled) {
        for (const auto& ev : res.events) draw_face(res.frame, ev);
    }
    return res;
}

void FaceMatcher::draw_face(cv::Mat& frame, const FaceEvent& ev) const {
    const cv::Scalar color = ev.known() ? cv::Scalar(0, 255, 0) : cv::Scalar(0, 0, 255);
    const cv::Rect& b = ev.box;
    cv::rectangle(frame, b, color, 2);
    cv::rectangle(frame, cv::Point(b.x, b.y + b.height - 35), cv::Point(b.x + b.width, b.y + b.height),
                  color, cv::FILLED);
    std::string label = ev.known() ? cv::format("%s (%.1f%%)", ev.identity.c_str(), ev.confidence)
                                   : std::string(kUnknownIdentity);
    cv::putText(frame, label, cv::Point(b.x + 6, b.y + b.height - 6),
                cv::FONT_HERSHEY_DUPLEX, 0.6, cv::Scalar(255, 255, 255), 1);
}

}  // namespace facewatch
