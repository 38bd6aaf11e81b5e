#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "facewatch/config.hpp"
#include "facewatch/frame_types.hpp"

namespace facewatch {

struct EventRecord {
    EventKind kind{EventKind::Motion};
    std::string payload;       // JSON object text
    double confidence{0.0};
    ImagePayload image;
    DeviceIdentity device;
    std::chrono::system_clock::time_point created_at{};
    std::string capture_file;  // local copy of the image, empty when none was kept
};

struct SaveResult {
    bool ok{false};
    std::string id;
    std::string error;

    static SaveResult success(std::string id) { return SaveResult{true, std::move(id), {}}; }
    static SaveResult failure(std::string error) { return SaveResult{false, {}, std::move(error)}; }
};

// Durable event sink. Calls may block; failures are reported, never thrown.
class EventStore {
public:
    virtual ~EventStore() = default;
    virtual SaveResult save_event(const EventRecord& record) = 0;
};

// Appends one JSON line per event. Embedded images are written inline as
// base64 together with the path of the local capture copy, if any.
class JsonlEventStore : public EventStore {
public:
    explicit JsonlEventStore(const std::string& path);
    SaveResult save_event(const EventRecord& record) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mu_;
};

// gRPC store when cfg.store_addr is set, the JSONL file otherwise.
std::unique_ptr<EventStore> make_event_store(const AppConfig& cfg);

}  // namespace facewatch
