#include "facewatch/server_app.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "facewatch/json_util.hpp"
#include "facewatch/stream_sink.hpp"

namespace facewatch {

static constexpr size_t kStatusWorkers = 4;

std::string upload_status_json(const UploadStatus& st) {
    std::ostringstream oss;
    oss << "{ \"can_upload_now\": " << (st.can_upload_now ? "true" : "false")
        << ", \"remaining_delay\": " << std::fixed << std::setprecision(1) << st.remaining_delay.count()
        << " }";
    return oss.str();
}

std::string pipeline_status_json(const PipelineStats& st, size_t gallery_size, const DeviceIdentity& device) {
    std::ostringstream oss;
    oss << "{ \"running\": " << (st.running ? "true" : "false")
        << ", \"uptime_sec\": " << std::fixed << std::setprecision(1) << st.uptime_sec
        << ", \"frames\": " << st.frames
        << ", \"source_unavailable\": " << st.source_unavailable
        << ", \"detection_errors\": " << st.detection_errors
        << ", \"motion_events\": " << st.motion_events
        << ", \"face_events\": " << st.face_events
        << ", \"gallery_size\": " << gallery_size
        << ", \"device\": {"
        << "\"serial_number\":\"" << json_escape(device.serial) << "\","
        << "\"model\":\"" << json_escape(device.model) << "\""
        << "}"
        << " }";
    return oss.str();
}

ServerApp::ServerApp(const AppConfig& cfg,
                     const FrameBuffer& buffer,
                     const UploadScheduler& scheduler,
                     const Pipeline& pipeline,
                     const FaceMatcher& faces)
    : cfg_(cfg),
      buffer_(buffer),
      scheduler_(scheduler),
      pipeline_(pipeline),
      faces_(faces),
      stream_slots_(static_cast<size_t>(cfg.max_stream_clients)) {}

ServerApp::~ServerApp() {
    stop();
}

void ServerApp::start() {
    if (http_running_) return;
    http_srv_ = std::make_unique<httplib::Server>();
    const size_t workers = stream_slots_.capacity() + kStatusWorkers;
    http_srv_->new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
    setup_routes();
    http_running_ = true;
    http_thread_ = std::thread(&ServerApp::run_http, this);
}

void ServerApp::stop() {
    http_running_ = false;
    if (http_srv_) {
        http_srv_->stop();
    }
    if (http_thread_.joinable()) http_thread_.join();
}

void ServerApp::run_http() {
    const char* host = "0.0.0.0";
    if (!http_srv_->listen(host, cfg_.http_port)) {
        std::cerr << "[ERROR] HTTP server failed to listen on port " << cfg_.http_port << std::endl;
        http_running_ = false;
    }
}

void ServerApp::setup_routes() {
    http_srv_->Get("/video_feed", [this](const httplib::Request&, httplib::Response& res) {
        if (!stream_slots_.try_acquire()) {
            std::cerr << "[http] Refusing stream viewer, " << stream_slots_.capacity()
                      << " already connected" << std::endl;
            res.status = 503;
            res.set_header("Retry-After", "5");
            res.set_content("{ \"error\": \"too many stream viewers\" }", "application/json");
            return;
        }
        res.set_header("Cache-Control", "no-store, no-cache, must-revalidate");
        res.set_header("Pragma", "no-cache");
        auto sink = std::make_shared<StreamSink>(buffer_);
        res.set_chunked_content_provider(
            std::string("multipart/x-mixed-replace; boundary=") + kMjpegBoundary,
            [this, sink](size_t, httplib::DataSink& out) {
                while (http_running_) {
                    if (auto part = sink->next_part()) {
                        if (!out.write(part->data(), part->size())) return false;
                    }
                    std::this_thread::sleep_for(sink->interval());
                }
                out.done();
                return true;
            },
            [this](bool) { stream_slots_.release(); });
    });

    http_srv_->Get("/upload_status", [this](const httplib::Request&, httplib::Response& res) {
        UploadStatus st = scheduler_.upload_status(Clock::now());
        res.set_content(upload_status_json(st), "application/json");
    });

    http_srv_->Get("/status", [this](const httplib::Request&, httplib::Response& res) {
        DeviceIdentity device{cfg_.device_serial, cfg_.device_model};
        res.set_content(pipeline_status_json(pipeline_.stats(), faces_.gallery_size(), device),
                        "application/json");
    });

    http_srv_->set_default_headers({{"Access-Control-Allow-Origin", "*"}});
}

}  // namespace facewatch
