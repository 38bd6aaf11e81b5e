#include "facewatch/grpc_event_store.hpp"

#include <grpcpp/grpcpp.h>

#include "events.grpc.pb.h"
#include "facewatch/json_util.hpp"

namespace facewatch {

namespace {

struct PhotoSetter {
    rpc::EventRequest& req;
    void operator()(const EmbeddedImage& img) const {
        req.set_embedded_jpeg(std::string(img.bytes.begin(), img.bytes.end()));
    }
    void operator()(const RemoteImage& img) const { req.set_remote_url(img.url); }
};

}  // namespace

struct GrpcEventStore::Impl {
    std::string address;
    std::chrono::milliseconds deadline;
    std::shared_ptr<grpc::Channel> channel;
    std::unique_ptr<rpc::EventStore::Stub> stub;

    Impl(const std::string& addr, std::chrono::milliseconds dl)
        : address(addr), deadline(dl) {
        channel = grpc::CreateChannel(address, grpc::InsecureChannelCredentials());
        stub = rpc::EventStore::NewStub(channel);
    }
};

GrpcEventStore::GrpcEventStore(const std::string& address, std::chrono::milliseconds deadline)
    : d_(std::make_unique<Impl>(address, deadline)) {}

GrpcEventStore::~GrpcEventStore() = default;

SaveResult GrpcEventStore::save_event(const EventRecord& record) {
    rpc::EventRequest req;
    req.set_kind(record.kind == EventKind::Face ? rpc::EventRequest::FACE : rpc::EventRequest::MOTION);
    req.set_payload(record.payload);
    req.set_confidence(record.confidence);
    std::visit(PhotoSetter{req}, record.image);
    req.mutable_device()->set_serial_number(record.device.serial);
    req.mutable_device()->set_model(record.device.model);
    req.set_created_at(iso8601_utc(record.created_at));
    req.set_capture_file(record.capture_file);

    grpc::ClientContext ctx;
    ctx.set_deadline(std::chrono::system_clock::now() + d_->deadline);
    rpc::EventReply reply;
    grpc::Status status = d_->stub->SaveEvent(&ctx, req, &reply);
    if (!status.ok()) {
        return SaveResult::failure("SaveEvent to " + d_->address + " failed: " + status.error_message());
    }
    return SaveResult::success(reply.id());
}

}  // namespace facewatch
