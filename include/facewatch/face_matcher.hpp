#pragma once

#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "facewatch/face_analyzer.hpp"
#include "facewatch/frame_types.hpp"
#include "facewatch/gallery.hpp"

namespace facewatch {

struct MatchParams {
    double tolerance{0.5};        // maximum distance for a candidate match
    double min_confidence{60.0};  // inclusive threshold for accepting an identity
    bool overlay_enabled{true};
};

struct FaceClassification {
    std::string identity{kUnknownIdentity};
    double confidence{0.0};
    double distance{-1.0};
    int gallery_index{-1};   // best matching entry, -1 when nothing matched
    bool matched{false};     // some entry was within tolerance
};

// Euclidean distance between two embeddings.
double face_distance(const cv::Mat& a, const cv::Mat& b);

double confidence_from_distance(double distance);

bool accepts_identity(double confidence, double min_confidence);

FaceClassification classify_embedding(const cv::Mat& embedding,
                                      const Gallery& gallery,
                                      const MatchParams& params);

struct FaceResult {
    cv::Mat frame;
    std::vector<FaceEvent> events;  // at most one per detected face
    bool ok{true};
    std::string error;
};

class FaceMatcher {
public:
    FaceMatcher(std::shared_ptr<const Gallery> gallery,
                std::shared_ptr<FaceAnalyzer> analyzer,
                const MatchParams& params);

    // Pass-through while the gallery is empty or no analyzer is available.
    FaceResult process(const Frame& frame);

    // Only called from the producer thread.
    void set_gallery(std::shared_ptr<const Gallery> gallery);

    bool enabled() const;
    size_t gallery_size() const { return gallery_ ? gallery_->size() : 0; }

private:
    void draw_face(cv::Mat& frame, const FaceEvent& ev) const;

    std::shared_ptr<const Gallery> gallery_;
    std::shared_ptr<FaceAnalyzer> analyzer_;
    MatchParams params_;
};

}  // namespace facewatch
