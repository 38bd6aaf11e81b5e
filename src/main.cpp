#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

#include "facewatch/config.hpp"
#include "facewatch/cooldown_gate.hpp"
#include "facewatch/emission_controller.hpp"
#include "facewatch/event_builder.hpp"
#include "facewatch/event_store.hpp"
#include "facewatch/face_analyzer.hpp"
#include "facewatch/face_matcher.hpp"
#include "facewatch/frame_buffer.hpp"
#include "facewatch/frame_source.hpp"
#include "facewatch/gallery.hpp"
#include "facewatch/motion_detector.hpp"
#include "facewatch/pipeline.hpp"
#include "facewatch/server_app.hpp"
#include "facewatch/upload_scheduler.hpp"

using namespace std::chrono_literals;

namespace {
std::atomic<bool> g_stop{false};

void on_signal(int) {
    g_stop = true;
}
}  // namespace

int main(int argc, char** argv) {
    facewatch::AppConfig cfg = facewatch::parse_args(argc, argv);
    try {
        facewatch::validate_config(cfg);
    } catch (const facewatch::ConfigError& e) {
        std::cerr << "[ERROR] Invalid configuration: " << e.what() << std::endl;
        return 2;
    }

    std::cout << "[INFO] Starting facewatch node\n";
    std::cout << "       source : " << cfg.source << " (" << cfg.frame_width << "x" << cfg.frame_height
              << " @ " << cfg.target_fps << " fps)\n";
    std::cout << "       gallery: " << cfg.gallery_path << "\n";
    std::cout << "       device : " << cfg.device_serial << " / " << cfg.device_model << "\n";
    std::cout << "       upload : one event per " << cfg.upload_delay_sec << " s\n";

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::unique_ptr<facewatch::EventStore> store = facewatch::make_event_store(cfg);
    facewatch::UploadScheduler scheduler(*store, facewatch::Seconds(cfg.upload_delay_sec),
                                         static_cast<size_t>(cfg.upload_queue_capacity));
    scheduler.start();

    facewatch::CooldownGate cooldown(facewatch::Seconds(cfg.motion_cooldown_sec),
                                     facewatch::Seconds(cfg.face_cooldown_sec));
    facewatch::EmissionController emitter(cooldown, scheduler);
    facewatch::EventBuilder builder(facewatch::DeviceIdentity{cfg.device_serial, cfg.device_model},
                                    cfg.captures_dir);

    facewatch::MotionParams motion_params;
    motion_params.min_motion_area = cfg.min_motion_area;
    motion_params.aggregate_area = cfg.aggregate_motion_area;
    motion_params.sensitivity = cfg.motion_sensitivity;
    motion_params.bg_history = cfg.bg_history;
    motion_params.bg_var_threshold = cfg.bg_var_threshold;
    motion_params.display_duration = facewatch::Seconds(cfg.motion_display_sec);
    motion_params.overlay_enabled = cfg.overlay_enabled;
    facewatch::MotionDetector motion(motion_params);

    auto gallery = std::make_shared<const facewatch::Gallery>(facewatch::load_gallery(cfg.gallery_path));
    std::shared_ptr<facewatch::FaceAnalyzer> analyzer;
    if (!gallery->empty()) {
        auto opencv_analyzer = std::make_shared<facewatch::OpenCvFaceAnalyzer>(cfg.face_detector_model,
                                                                               cfg.face_recognizer_model);
        if (opencv_analyzer->ready()) {
            analyzer = opencv_analyzer;
        } else {
            std::cerr << "[WARN] Face models unavailable. Face recognition disabled." << std::endl;
        }
    }
    facewatch::MatchParams match_params;
    match_params.tolerance = cfg.face_tolerance;
    match_params.min_confidence = cfg.face_min_confidence;
    match_params.overlay_enabled = cfg.overlay_enabled;
    facewatch::FaceMatcher faces(gallery, analyzer, match_params);

    facewatch::CameraSettings cam_settings;
    cam_settings.source = cfg.source;
    cam_settings.width = cfg.frame_width;
    cam_settings.height = cfg.frame_height;
    cam_settings.fps = cfg.target_fps;
    facewatch::CameraSource camera(cam_settings);
    if (camera.open()) {
        camera.configure();
    } else {
        std::cerr << "[WARN] Camera not available yet; the pipeline will keep retrying" << std::endl;
    }
    camera.start();

    facewatch::FrameBuffer buffer;
    facewatch::PipelineParams pipe_params;
    pipe_params.target_fps = cfg.target_fps;
    facewatch::Pipeline pipeline(camera, motion, faces, emitter, builder, buffer, pipe_params);
    pipeline.start();

    facewatch::ServerApp server(cfg, buffer, scheduler, pipeline, faces);
    server.start();
    std::cout << "[INFO] Video stream: http://0.0.0.0:" << cfg.http_port << "/video_feed\n";
    std::cout << "[INFO] Press Ctrl+C to exit\n";

    while (!g_stop) {
        std::this_thread::sleep_for(200ms);
    }

    std::cout << "\n[INFO] Shutting down...\n";
    server.stop();
    pipeline.stop();
    camera.stop();
    camera.close();
    scheduler.stop(false);
    std::cout << "[INFO] Stopped facewatch node\n";
    return 0;
}
