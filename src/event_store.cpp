#include "facewatch/event_store.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "facewatch/grpc_event_store.hpp"
#include "facewatch/json_util.hpp"

namespace facewatch {

namespace {

struct ImageJson {
    std::ostringstream& oss;
    void operator()(const EmbeddedImage& img) const {
        oss << "{\"type\":\"embedded\",\"mime_type\":\"" << json_escape(img.mime_type)
            << "\",\"bytes\":" << img.bytes.size()
            << ",\"data\":\"" << base64_encode(img.bytes) << "\"}";
    }
    void operator()(const RemoteImage& img) const {
        oss << "{\"type\":\"remote\",\"url\":\"" << json_escape(img.url) << "\"}";
    }
};

}  // namespace

JsonlEventStore::JsonlEventStore(const std::string& path) : path_(path) {}

SaveResult JsonlEventStore::save_event(const EventRecord& record) {
    const std::string id = make_event_id();

    std::ostringstream oss;
    oss << "{";
    oss << "\"id\":\"" << id << "\",";
    oss << "\"kind\":\"" << event_kind_to_string(record.kind) << "\",";
    oss << "\"data\":" << (record.payload.empty() ? "{}" : record.payload) << ",";
    oss << "\"confidence\":" << std::fixed << std::setprecision(1) << record.confidence << ",";
    oss << "\"captured_photo\":";
    std::visit(ImageJson{oss}, record.image);
    oss << ",";
    if (!record.capture_file.empty()) {
        oss << "\"capture_file\":\"" << json_escape(record.capture_file) << "\",";
    }
    oss << "\"device_serial_number\":\"" << json_escape(record.device.serial) << "\",";
    oss << "\"device_model\":\"" << json_escape(record.device.model) << "\",";
    oss << "\"created_at\":\"" << iso8601_utc(record.created_at) << "\"";
    oss << "}\n";

    std::lock_guard<std::mutex> lock(mu_);
    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return SaveResult::failure("cannot create " + parent.string() + ": " + ec.message());
        }
    }
    std::ofstream f(path_, std::ios::app);
    if (!f) {
        return SaveResult::failure("unable to open events file: " + path_);
    }
    f << oss.str();
    f.flush();
    if (!f) {
        return SaveResult::failure("write failed: " + path_);
    }
    return SaveResult::success(id);
}

std::unique_ptr<EventStore> make_event_store(const AppConfig& cfg) {
    if (!cfg.store_addr.empty()) {
        std::cout << "[INFO] Persisting events to gRPC store at " << cfg.store_addr << "\n";
        return std::make_unique<GrpcEventStore>(cfg.store_addr);
    }
    std::cout << "[INFO] Persisting events to " << cfg.events_jsonl << "\n";
    return std::make_unique<JsonlEventStore>(cfg.events_jsonl);
}

}  // namespace facewatch
