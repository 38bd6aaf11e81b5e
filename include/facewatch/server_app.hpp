#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>

#include "facewatch/config.hpp"
#include "facewatch/frame_buffer.hpp"
#include "facewatch/pipeline.hpp"
#include "facewatch/stream_sink.hpp"
#include "facewatch/upload_scheduler.hpp"

namespace facewatch {

std::string upload_status_json(const UploadStatus& st);
std::string pipeline_status_json(const PipelineStats& st, size_t gallery_size, const DeviceIdentity& device);

// HTTP front: MJPEG live feed plus read-only status endpoints. Live feeds
// are capped at cfg.max_stream_clients; the worker pool keeps spare threads
// beyond that for the status routes.
class ServerApp {
public:
    ServerApp(const AppConfig& cfg,
              const FrameBuffer& buffer,
              const UploadScheduler& scheduler,
              const Pipeline& pipeline,
              const FaceMatcher& faces);
    ~ServerApp();

    void start();
    void stop();

private:
    void run_http();
    void setup_routes();

    AppConfig cfg_;
    const FrameBuffer& buffer_;
    const UploadScheduler& scheduler_;
    const Pipeline& pipeline_;
    const FaceMatcher& faces_;

    StreamSlots stream_slots_;
    std::atomic<bool> http_running_{false};
    std::thread http_thread_;
    std::unique_ptr<httplib::Server> http_srv_;
};

}  // namespace facewatch
