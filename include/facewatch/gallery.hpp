#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace facewatch {

struct GalleryEntry {
    std::string name;
    cv::Mat embedding;  // 1 x N unit row, CV_32F or CV_64F
};

// L2-normalized 1 x N copy of an embedding. CV_32F and CV_64F inputs keep
// their depth, other depths become CV_64F. Empty when the input is empty or
// has zero length.
cv::Mat unit_embedding(const cv::Mat& embedding);

// Known identities and their reference embeddings, stored at unit length.
// A name may appear more than once. Read-only once handed to the matcher.
class Gallery {
public:
    Gallery() = default;
    explicit Gallery(std::vector<GalleryEntry> entries);

    void add(const std::string& name, const cv::Mat& embedding);

    const std::vector<GalleryEntry>& entries() const { return entries_; }
    const GalleryEntry& at(size_t i) const { return entries_.at(i); }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    size_t identity_count() const;

private:
    std::vector<GalleryEntry> entries_;
};

// Reads an OpenCV FileStorage document (YAML, XML or JSON) holding a `names`
// sequence and an `encodings` matrix with one row per name. Any problem
// yields an empty gallery, which disables face matching.
Gallery load_gallery(const std::string& path);

// Writes the same layout load_gallery() reads.
bool save_gallery(const Gallery& gallery, const std::string& path);

}  // namespace facewatch
