#pragma once

#include <stdexcept>
#include <string>

namespace facewatch {

// Raised for startup-time configuration problems; the only fatal error class.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct AppConfig {
    std::string source{"0"};          // camera index as string or URL/RTSP
    int frame_width{640};
    int frame_height{480};
    int target_fps{30};
    int http_port{5000};
    int max_stream_clients{4};        // concurrent /video_feed viewers

    std::string gallery_path{"encodings.yml"};
    std::string face_detector_model{"model/face_detection_yunet_2023mar.onnx"};
    std::string face_recognizer_model{"model/face_recognition_sface_2021dec.onnx"};
    double face_tolerance{0.5};
    double face_min_confidence{60.0};

    double min_motion_area{200.0};
    double aggregate_motion_area{1000.0};
    double motion_sensitivity{30.0};
    int bg_history{500};
    double bg_var_threshold{16.0};
    double motion_display_sec{3.0};

    double motion_cooldown_sec{30.0};
    double face_cooldown_sec{30.0};
    double upload_delay_sec{30.0};
    int upload_queue_capacity{16};

    std::string store_addr{};         // empty selects the local JSONL store
    std::string events_jsonl{"events.jsonl"};
    std::string captures_dir{"captures"};

    std::string device_serial{"SNABC123"};
    std::string device_model{"RPI3"};

    bool overlay_enabled{true};
};

AppConfig parse_args(int argc, char** argv);

// Throws ConfigError when a value cannot be used to start the node.
void validate_config(const AppConfig& cfg);

}  // namespace facewatch
