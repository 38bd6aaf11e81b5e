#include "facewatch/config.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace facewatch {

static bool arg_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

static void env_string(const char* key, std::string& out) {
    if (const char* v = std::getenv(key)) out = v;
}

static void env_int(const char* key, int& out) {
    if (const char* v = std::getenv(key)) out = std::atoi(v);
}

static void env_double(const char* key, double& out) {
    if (const char* v = std::getenv(key)) out = std::atof(v);
}

static void print_usage() {
    std::cout << "Usage: facewatch_node [--source <src>] [--width <px>] [--height <px>] [--fps <int>]\n"
              << "                      [--port <int>] [--max-streams <int>] [--gallery <file>]\n"
              << "                      [--face-detector <onnx>] [--face-recognizer <onnx>]\n"
              << "                      [--tolerance <dist>] [--min-confidence <pct>]\n"
              << "                      [--min-area <px>] [--aggregate-area <px>] [--sensitivity <0-255>]\n"
              << "                      [--bg-history <frames>] [--bg-var-threshold <v>]\n"
              << "                      [--motion-cooldown <s>] [--face-cooldown <s>] [--upload-delay <s>]\n"
              << "                      [--queue-capacity <int>] [--store-addr <host:port>] [--events <path>]\n"
              << "                      [--captures <dir>] [--device-serial <sn>] [--device-model <model>]\n"
              << "                      [--no-overlay]\n";
}

AppConfig parse_args(int argc, char** argv) {
    AppConfig cfg;

    env_string("VIDEO_SOURCE", cfg.source);
    env_int("FRAME_WIDTH", cfg.frame_width);
    env_int("FRAME_HEIGHT", cfg.frame_height);
    env_int("FPS", cfg.target_fps);
    env_int("HTTP_PORT", cfg.http_port);
    env_int("MAX_STREAM_CLIENTS", cfg.max_stream_clients);
    env_string("GALLERY_PATH", cfg.gallery_path);
    env_string("FACE_DETECTOR_MODEL", cfg.face_detector_model);
    env_string("FACE_RECOGNIZER_MODEL", cfg.face_recognizer_model);
    env_double("FACE_TOLERANCE", cfg.face_tolerance);
    env_double("FACE_MIN_CONFIDENCE", cfg.face_min_confidence);
    env_double("MIN_MOTION_AREA", cfg.min_motion_area);
    env_double("AGGREGATE_MOTION_AREA", cfg.aggregate_motion_area);
    env_double("MOTION_SENSITIVITY", cfg.motion_sensitivity);
    env_int("BG_HISTORY", cfg.bg_history);
    env_double("BG_VAR_THRESHOLD", cfg.bg_var_threshold);
    env_double("MOTION_COOLDOWN", cfg.motion_cooldown_sec);
    env_double("FACE_COOLDOWN", cfg.face_cooldown_sec);
    env_double("UPLOAD_DELAY", cfg.upload_delay_sec);
    env_int("UPLOAD_QUEUE_CAPACITY", cfg.upload_queue_capacity);
    env_string("EVENT_STORE_ADDR", cfg.store_addr);
    env_string("EVENTS_JSONL", cfg.events_jsonl);
    env_string("CAPTURES_DIR", cfg.captures_dir);
    env_string("DEVICE_SERIAL", cfg.device_serial);
    env_string("DEVICE_MODEL", cfg.device_model);

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&](int offset = 1) -> const char* {
            if (i + offset < argc) return argv[i + offset];
            return nullptr;
        };

        if (arg_eq(arg, "--source") && next()) {
            cfg.source = next();
            i++;
        } else if (arg_eq(arg, "--width") && next()) {
            cfg.frame_width = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--height") && next()) {
            cfg.frame_height = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--fps") && next()) {
            cfg.target_fps = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--port") && next()) {
            cfg.http_port = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--max-streams") && next()) {
            cfg.max_stream_clients = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--gallery") && next()) {
            cfg.gallery_path = next();
            i++;
        } else if (arg_eq(arg, "--face-detector") && next()) {
            cfg.face_detector_model = next();
            i++;
        } else if (arg_eq(arg, "--face-recognizer") && next()) {
            cfg.face_recognizer_model = next();
            i++;
        } else if (arg_eq(arg, "--tolerance") && next()) {
            cfg.face_tolerance = std::atof(next());
            i++;
        } else if (arg_eq(arg, "--min-confidence") && next()) {
            cfg.face_min_confidence = std::atof(next());
            i++;
        } else if (arg_eq(arg, "--min-area") && next()) {
            cfg.min_motion_area = std::atof(next());
            i++;
        } else if (arg_eq(arg, "--aggregate-area") && next()) {
            cfg.aggregate_motion_area = std::atof(next());
            i++;
        } else if (arg_eq(arg, "--sensitivity") && next()) {
            cfg.motion_sensitivity = std::atof(next());
            i++;
        } else if (arg_eq(arg, "--bg-history") && next()) {
            cfg.bg_history = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--bg-var-threshold") && next()) {
            cfg.bg_var_threshold = std::atof(next());
            i++;
        } else if (arg_eq(arg, "--motion-cooldown") && next()) {
            cfg.motion_cooldown_sec = std::atof(next());
            i++;
        } else if (arg_eq(arg, "--face-cooldown") && next()) {
            cfg.face_cooldown_sec = std::atof(next());
            i++;
        } else if (arg_eq(arg, "--upload-delay") && next()) {
            cfg.upload_delay_sec = std::atof(next());
            i++;
        } else if (arg_eq(arg, "--queue-capacity") && next()) {
            cfg.upload_queue_capacity = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--store-addr") && next()) {
            cfg.store_addr = next();
            i++;
        } else if (arg_eq(arg, "--events") && next()) {
            cfg.events_jsonl = next();
            i++;
        } else if (arg_eq(arg, "--captures") && next()) {
            cfg.captures_dir = next();
            i++;
        } else if (arg_eq(arg, "--device-serial") && next()) {
            cfg.device_serial = next();
            i++;
        } else if (arg_eq(arg, "--device-model") && next()) {
            cfg.device_model = next();
            i++;
        } else if (arg_eq(arg, "--no-overlay")) {
            cfg.overlay_enabled = false;
        } else if (arg_eq(arg, "--help")) {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "[WARN] Ignoring unknown or incomplete argument: " << arg << std::endl;
        }
    }

    return cfg;
}

void validate_config(const AppConfig& cfg) {
    if (cfg.source.empty()) {
        throw ConfigError("video source must not be empty");
    }
    if (cfg.frame_width <= 0 || cfg.frame_height <= 0) {
        throw ConfigError("invalid resolution " + std::to_string(cfg.frame_width) + "x" +
                          std::to_string(cfg.frame_height));
    }
    if (cfg.target_fps <= 0) {
        throw ConfigError("fps must be positive");
    }
    if (cfg.http_port <= 0 || cfg.http_port > 65535) {
        throw ConfigError("http port out of range: " + std::to_string(cfg.http_port));
    }
    if (cfg.max_stream_clients <= 0) {
        throw ConfigError("max stream clients must be positive");
    }
    if (cfg.face_tolerance <= 0.0) {
        throw ConfigError("face tolerance must be positive");
    }
    if (cfg.face_min_confidence < 0.0 || cfg.face_min_confidence > 100.0) {
        throw ConfigError("face confidence threshold must be within [0, 100]");
    }
    if (cfg.min_motion_area < 0.0 || cfg.aggregate_motion_area < 0.0) {
        throw ConfigError("motion area thresholds must not be negative");
    }
    if (cfg.motion_sensitivity < 0.0 || cfg.motion_sensitivity > 255.0) {
        throw ConfigError("motion sensitivity must be within [0, 255]");
    }
    if (cfg.bg_history <= 0 || cfg.bg_var_threshold <= 0.0) {
        throw ConfigError("background model history and variance threshold must be positive");
    }
    if (cfg.motion_display_sec < 0.0 || cfg.motion_cooldown_sec < 0.0 ||
        cfg.face_cooldown_sec < 0.0 || cfg.upload_delay_sec < 0.0) {
        throw ConfigError("cooldown and delay windows must not be negative");
    }
    if (cfg.upload_queue_capacity <= 0) {
        throw ConfigError("upload queue capacity must be positive");
    }
}

}  // namespace facewatch
