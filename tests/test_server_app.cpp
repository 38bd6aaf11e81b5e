#include <gtest/gtest.h>

#include <string>

#include "facewatch/server_app.hpp"

using namespace facewatch;

TEST(ServerJsonTest, UploadStatusWhenOpen) {
    EXPECT_EQ(upload_status_json(UploadStatus{}),
              "{ \"can_upload_now\": true, \"remaining_delay\": 0.0 }");
}

TEST(ServerJsonTest, UploadStatusWhenDelayed) {
    UploadStatus st;
    st.can_upload_now = false;
    st.remaining_delay = Seconds(12.34);
    EXPECT_EQ(upload_status_json(st),
              "{ \"can_upload_now\": false, \"remaining_delay\": 12.3 }");
}

TEST(ServerJsonTest, PipelineStatusCarriesCountersAndDevice) {
    PipelineStats st;
    st.running = true;
    st.frames = 42;
    st.face_events = 3;
    std::string json = pipeline_status_json(st, 5, DeviceIdentity{"SN\"1", "RPI3"});
    EXPECT_NE(json.find("\"running\": true"), std::string::npos);
    EXPECT_NE(json.find("\"frames\": 42"), std::string::npos);
    EXPECT_NE(json.find("\"face_events\": 3"), std::string::npos);
    EXPECT_NE(json.find("\"gallery_size\": 5"), std::string::npos);
    EXPECT_NE(json.find("\"serial_number\":\"SN\\\"1\""), std::string::npos);
}
