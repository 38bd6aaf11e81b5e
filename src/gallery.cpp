#include "facewatch/gallery.hpp"

#include <cmath>
#include <filesystem>
#include <iostream>
#include <set>

#include <opencv2/core/persistence.hpp>

namespace facewatch {

cv::Mat unit_embedding(const cv::Mat& embedding) {
    if (embedding.empty()) return cv::Mat();
    cv::Mat row = embedding.isContinuous() ? embedding.reshape(1, 1) : embedding.clone().reshape(1, 1);
    const int depth = row.depth() == CV_32F ? CV_32F : CV_64F;
    cv::Mat out;
    row.convertTo(out, depth);

    const double length = cv::norm(out, cv::NORM_L2);
    if (!(length > 0.0) || !std::isfinite(length)) return cv::Mat();
    cv::normalize(out, out, 1.0, 0.0, cv::NORM_L2);
    return out;
}

Gallery::Gallery(std::vector<GalleryEntry> entries) {
    entries_.reserve(entries.size());
    for (auto& e : entries) {
        add(e.name, e.embedding);
    }
}

void Gallery::add(const std::string& name, const cv::Mat& embedding) {
    if (embedding.empty()) return;
    cv::Mat unit = unit_embedding(embedding);
    if (unit.empty()) {
        std::cerr << "[WARN] Skipping zero-length embedding for '" << name << "'" << std::endl;
        return;
    }
    entries_.push_back(GalleryEntry{name, unit});
}

size_t Gallery::identity_count() const {
    std::set<std::string> names;
    for (const auto& e : entries_) names.insert(e.name);
    return names.size();
}

Gallery load_gallery(const std::string& path) {
    Gallery gallery;
    if (path.empty() || !std::filesystem::exists(path)) {
        std::cout << "[INFO] No gallery file at '" << path << "'. Face recognition disabled.\n";
        return gallery;
    }

    try {
        cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            std::cerr << "[WARN] Unable to open gallery file: " << path << std::endl;
            return gallery;
        }

        std::vector<std::string> names;
        cv::FileNode names_node = fs["names"];
        if (names_node.type() != cv::FileNode::SEQ) {
            std::cerr << "[WARN] Gallery file has no 'names' sequence: " << path << std::endl;
            return gallery;
        }
        for (const auto& n : names_node) {
            names.push_back(static_cast<std::string>(n));
        }

        cv::Mat encodings;
        fs["encodings"] >> encodings;
        if (encodings.empty() || encodings.rows != static_cast<int>(names.size())) {
            std::cerr << "[WARN] Gallery file is malformed (" << names.size() << " names, "
                      << encodings.rows << " encodings): " << path << std::endl;
            return gallery;
        }

        for (int i = 0; i < encodings.rows; ++i) {
            gallery.add(names[i], encodings.row(i));
        }
    } catch (const cv::Exception& e) {
        std::cerr << "[WARN] Error loading gallery " << path << ": " << e.what() << std::endl;
        return Gallery{};
    }

    std::cout << "[INFO] Loaded " << gallery.size() << " face encodings for "
              << gallery.identity_count() << " users\n";
    return gallery;
}

bool save_gallery(const Gallery& gallery, const std::string& path) {
    if (gallery.empty()) return false;
    try {
        cv::Mat encodings;
        std::vector<std::string> names;
        for (const auto& e : gallery.entries()) {
            cv::Mat row;
            e.embedding.convertTo(row, CV_64F);
            encodings.push_back(row);
            names.push_back(e.name);
        }
        cv::FileStorage fs(path, cv::FileStorage::WRITE);
        if (!fs.isOpened()) return false;
        fs << "names" << names;
        fs << "encodings" << encodings;
        return true;
    } catch (const cv::Exception& e) {
        std::cerr << "[WARN] Error writing gallery " << path << ": " << e.what() << std::endl;
        return false;
    }
}

}  // namespace facewatch
