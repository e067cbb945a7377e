#include "notification_log_service.h"

#include <stdexcept>

#include <grpcpp/grpcpp.h>
#include <glog/logging.h>

#include "common/config.h"
#include "notification/section_codec.h"
#include "rpc/status_mapping.h"

namespace Chronicle {

using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::Status;
using grpc::StatusCode;
using chronicle::log::AppendRequest;
using chronicle::log::AppendResponse;
using chronicle::log::GetSectionRequest;
using chronicle::log::GetSectionResponse;

NotificationLogServiceImpl::NotificationLogServiceImpl(std::shared_ptr<INotificationLog> log,
                                                       int64_t archived_max_age_seconds)
    : log_(std::move(log)), archived_max_age_seconds_(archived_max_age_seconds) {
    if (!log_) {
        throw std::invalid_argument("NotificationLogServiceImpl needs a notification log");
    }
}

Status NotificationLogServiceImpl::GetSection(ServerContext* context,
                                              const GetSectionRequest* request,
                                              GetSectionResponse* response) {
    NotificationSection section;
    try {
        section = log_->GetSection(request->section_id());
    } catch (const std::exception& e) {
        VLOG(1) << "GetSection(" << request->section_id() << ") failed: " << e.what();
        return StatusFromException(e);
    }

    const std::string etag = ComputeETag(section);
    const bool archived = section.IsArchived();
    response->set_archived(archived);
    response->set_etag(etag);
    response->set_max_age_seconds(archived ? archived_max_age_seconds_ : 0);

    if (!request->if_none_match().empty() && request->if_none_match() == etag) {
        response->set_not_modified(true);
        response->mutable_section()->set_section_id(section.section_id);
        return Status::OK;
    }
    ToProto(section, response->mutable_section());
    return Status::OK;
}

LogWriterServiceImpl::LogWriterServiceImpl(std::shared_ptr<ILogWriter> writer)
    : writer_(std::move(writer)) {
    if (!writer_) {
        throw std::invalid_argument("LogWriterServiceImpl needs a log writer");
    }
}

Status LogWriterServiceImpl::Append(ServerContext* context, const AppendRequest* request,
                                    AppendResponse* response) {
    if (request->topic().empty()) {
        return Status(StatusCode::INVALID_ARGUMENT, "Topic must not be empty");
    }
    if (request->topic() == kArrayNodeTopic || request->topic() == kArrayApexTopic) {
        return Status(StatusCode::INVALID_ARGUMENT, "Topic '" + request->topic() + "' is reserved");
    }
    CausalDependencies causal_dependencies;
    causal_dependencies.reserve(request->causal_dependencies_size());
    for (const auto& dependency : request->causal_dependencies()) {
        causal_dependencies.push_back(FromProto(dependency));
    }
    try {
        response->set_position(
            writer_->Append(request->topic(), request->data(), causal_dependencies));
    } catch (const std::exception& e) {
        LOG(WARNING) << "Append of '" << request->topic() << "' failed: " << e.what();
        return StatusFromException(e);
    }
    return Status::OK;
}

LogServer::LogServer(const std::string& address, int port,
                     const std::vector<grpc::Service*>& services) {
    const std::string server_address = address + ":" + std::to_string(port);
    ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials(), &bound_port_);
    for (grpc::Service* service : services) {
        builder.RegisterService(service);
    }

    server_ = builder.BuildAndStart();
    if (!server_ || bound_port_ == 0) {
        throw std::runtime_error("Failed to start log server on " + server_address);
    }
    LOG(INFO) << "Log server listening on " << address << ":" << bound_port_;

    server_thread_ = std::thread([this]() { server_->Wait(); });
}

std::shared_ptr<grpc::Channel> LogServer::InProcessChannel() {
    return server_->InProcessChannel(grpc::ChannelArguments());
}

LogServer::~LogServer() {
    Shutdown();
}

void LogServer::Wait() {
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

void LogServer::Shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    VLOG(1) << "Shutting down log server";
    server_->Shutdown();
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

} // namespace Chronicle
