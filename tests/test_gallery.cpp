#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include <opencv2/core/persistence.hpp>

#include "facewatch/gallery.hpp"
#include "test_helpers.hpp"

using namespace facewatch;
using testing_util::embedding;
namespace fs = std::filesystem;

TEST(GalleryTest, CountsDistinctIdentities) {
    Gallery g;
    g.add("alice", embedding({0.1f, 0.2f}));
    g.add("alice", embedding({0.2f, 0.1f}));
    g.add("bob", embedding({0.9f, 0.9f}));
    g.add("ghost", cv::Mat());

    EXPECT_EQ(g.size(), 3u);
    EXPECT_EQ(g.identity_count(), 2u);
    EXPECT_EQ(g.at(2).name, "bob");
}

TEST(GalleryTest, SavedGalleryLoadsBack) {
    auto dir = testing_util::make_temp_dir("fw_gallery");
    const std::string path = (dir / "encodings.yml").string();

    Gallery g;
    g.add("alice", embedding({0.1f, 0.2f, 0.3f}));
    g.add("bob", embedding({0.4f, 0.5f, 0.6f}));
    ASSERT_TRUE(save_gallery(g, path));

    Gallery loaded = load_gallery(path);
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded.at(0).name, "alice");
    EXPECT_EQ(loaded.at(1).name, "bob");
    EXPECT_EQ(loaded.at(1).embedding.cols, 3);
    EXPECT_EQ(loaded.at(1).embedding.type(), CV_64F);
    cv::Mat expected;
    g.at(1).embedding.convertTo(expected, CV_64F);
    EXPECT_LT(cv::norm(loaded.at(1).embedding, expected, cv::NORM_INF), 1e-7);

    fs::remove_all(dir);
}

TEST(GalleryTest, EntriesAreStoredAtUnitLength) {
    Gallery g;
    g.add("alice", embedding({3.0f, 4.0f}));
    g.add("zero", embedding({0.0f, 0.0f}));
    ASSERT_EQ(g.size(), 1u);
    EXPECT_NEAR(g.at(0).embedding.at<float>(0, 0), 0.6f, 1e-6);
    EXPECT_NEAR(g.at(0).embedding.at<float>(0, 1), 0.8f, 1e-6);
}

// Encodings written at double precision are matched at double precision.
TEST(GalleryTest, DoublePrecisionEncodingsKeepTheirDepth) {
    auto dir = testing_util::make_temp_dir("fw_gallery");
    const std::string path = (dir / "encodings64.yml").string();
    {
        cv::FileStorage fs_out(path, cv::FileStorage::WRITE);
        fs_out << "names" << std::vector<std::string>{"alice"};
        fs_out << "encodings" << testing_util::embedding64({1.0, 0.0});
    }
    Gallery loaded = load_gallery(path);
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded.at(0).embedding.type(), CV_64F);
    EXPECT_EQ(loaded.at(0).embedding.at<double>(0, 0), 1.0);
    fs::remove_all(dir);
}

TEST(GalleryTest, MissingFileYieldsEmptyGallery) {
    Gallery g = load_gallery("/nonexistent/encodings.yml");
    EXPECT_TRUE(g.empty());
}

TEST(GalleryTest, MismatchedNamesAndEncodingsAreRejected) {
    auto dir = testing_util::make_temp_dir("fw_gallery");
    const std::string path = (dir / "bad.yml").string();
    {
        cv::FileStorage fs_out(path, cv::FileStorage::WRITE);
        fs_out << "names" << std::vector<std::string>{"alice", "bob"};
        cv::Mat one_row = embedding({0.1f, 0.2f});
        fs_out << "encodings" << one_row;
    }
    EXPECT_TRUE(load_gallery(path).empty());
    fs::remove_all(dir);
}

TEST(GalleryTest, GarbageFileYieldsEmptyGallery) {
    auto dir = testing_util::make_temp_dir("fw_gallery");
    const std::string path = (dir / "garbage.yml").string();
    {
        std::ofstream f(path);
        f << "this is: [not, a, gallery\n";
    }
    EXPECT_TRUE(load_gallery(path).empty());
    fs::remove_all(dir);
}
