#include "counter_service.h"

#include <limits>
#include <stdexcept>

#include <grpcpp/grpcpp.h>
#include <glog/logging.h>

#include "rpc/status_mapping.h"

namespace Chronicle {

using grpc::ClientContext;
using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::Status;
using grpc::StatusCode;
using chronicle::counter::AdvanceToRequest;
using chronicle::counter::CounterService;
using chronicle::counter::CounterValue;
using chronicle::counter::IncrementRequest;

Status CounterServiceImpl::Increment(ServerContext* context, const IncrementRequest* request,
                                     CounterValue* response) {
    absl::MutexLock lock(&mu_);
    int64_t& value = counters_[request->name()];
    if (value == std::numeric_limits<int64_t>::max()) {
        LOG(ERROR) << "Counter '" << request->name() << "' exhausted";
        return Status(StatusCode::OUT_OF_RANGE, "Counter exhausted: " + request->name());
    }
    ++value;
    response->set_value(value);
    return Status::OK;
}

Status CounterServiceImpl::AdvanceTo(ServerContext* context, const AdvanceToRequest* request,
                                     CounterValue* response) {
    if (request->floor() < 0) {
        return Status(StatusCode::INVALID_ARGUMENT, "Counter floor must not be negative");
    }
    absl::MutexLock lock(&mu_);
    int64_t& value = counters_[request->name()];
    if (value < request->floor()) {
        VLOG(1) << "Advancing counter '" << request->name() << "' from " << value << " to "
                << request->floor();
        value = request->floor();
    }
    response->set_value(value);
    return Status::OK;
}

int64_t CounterServiceImpl::Value(const std::string& name) const {
    absl::MutexLock lock(&mu_);
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
}

CounterServer::CounterServer(const std::string& address, int port)
    : service_(std::make_unique<CounterServiceImpl>()) {
    const std::string server_address = address + ":" + std::to_string(port);
    ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials(), &bound_port_);
    builder.RegisterService(service_.get());

    server_ = builder.BuildAndStart();
    if (!server_ || bound_port_ == 0) {
        throw std::runtime_error("Failed to start counter service on " + server_address);
    }
    LOG(INFO) << "Counter service listening on " << address << ":" << bound_port_;

    server_thread_ = std::thread([this]() { server_->Wait(); });
}

std::shared_ptr<grpc::Channel> CounterServer::InProcessChannel() {
    return server_->InProcessChannel(grpc::ChannelArguments());
}

CounterServer::~CounterServer() {
    Shutdown();
}

void CounterServer::Wait() {
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

void CounterServer::Shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    VLOG(1) << "Shutting down counter service";
    server_->Shutdown();
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

GrpcCounterClient::GrpcCounterClient(const std::string& server_address, std::string counter_name,
                                     std::chrono::milliseconds deadline)
    : GrpcCounterClient(grpc::CreateChannel(server_address, grpc::InsecureChannelCredentials()),
                        std::move(counter_name), deadline) {}

GrpcCounterClient::GrpcCounterClient(std::shared_ptr<grpc::Channel> channel,
                                     std::string counter_name,
                                     std::chrono::milliseconds deadline)
    : stub_(CounterService::NewStub(channel)),
      counter_name_(std::move(counter_name)),
      deadline_(deadline) {}

int64_t GrpcCounterClient::Increment() {
    IncrementRequest request;
    request.set_name(counter_name_);
    CounterValue response;
    ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + deadline_);

    ThrowIfError(stub_->Increment(&context, request, &response), "Counter Increment");
    return response.value();
}

int64_t GrpcCounterClient::AdvanceTo(int64_t floor) {
    AdvanceToRequest request;
    request.set_name(counter_name_);
    request.set_floor(floor);
    CounterValue response;
    ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + deadline_);

    ThrowIfError(stub_->AdvanceTo(&context, request, &response), "Counter AdvanceTo");
    return response.value();
}

} // namespace Chronicle
