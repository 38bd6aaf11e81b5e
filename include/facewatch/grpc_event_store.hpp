#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "facewatch/event_store.hpp"

namespace facewatch {

// Remote event store reached through the EventStore.SaveEvent RPC.
class GrpcEventStore : public EventStore {
public:
    explicit GrpcEventStore(const std::string& address,
                            std::chrono::milliseconds deadline = std::chrono::seconds(10));
    ~GrpcEventStore() override;

    SaveResult save_event(const EventRecord& record) override;

private:
    struct Impl;
    std::unique_ptr<Impl> d_;
};

}  // namespace facewatch
