#include "remote_notification_log.h"

#include <grpcpp/grpcpp.h>
#include <glog/logging.h>

#include "common/config.h"
#include "common/errors.h"
#include "notification/section_codec.h"
#include "rpc/status_mapping.h"

namespace Chronicle {

using grpc::ClientContext;
using grpc::Status;
using chronicle::log::AppendRequest;
using chronicle::log::AppendResponse;
using chronicle::log::GetSectionRequest;
using chronicle::log::GetSectionResponse;
using chronicle::log::LogWriterService;
using chronicle::log::NotificationLogService;

RemoteNotificationLog::RemoteNotificationLog(const std::string& server_address,
                                             std::chrono::milliseconds deadline,
                                             size_t cache_capacity)
    : RemoteNotificationLog(grpc::CreateChannel(server_address, grpc::InsecureChannelCredentials()),
                            deadline, cache_capacity) {}

RemoteNotificationLog::RemoteNotificationLog(std::shared_ptr<grpc::Channel> channel,
                                             std::chrono::milliseconds deadline,
                                             size_t cache_capacity)
    : stub_(NotificationLogService::NewStub(channel)),
      deadline_(deadline),
      archived_(cache_capacity),
      revalidate_(cache_capacity) {}

int64_t RemoteNotificationLog::RpcCount() const {
    absl::MutexLock lock(&mu_);
    return rpc_count_;
}

size_t RemoteNotificationLog::CachedSectionCount() const {
    absl::MutexLock lock(&mu_);
    return archived_.size() + revalidate_.size();
}

NotificationSection RemoteNotificationLog::GetSection(const std::string& section_id) {
    GetSectionRequest request;
    request.set_section_id(section_id);
    {
        absl::MutexLock lock(&mu_);
        if (const NotificationSection* archived = archived_.Find(section_id)) {
            return *archived;
        }
        if (const CachedSection* cached = revalidate_.Find(section_id)) {
            request.set_if_none_match(cached->etag);
        }
        ++rpc_count_;
    }

    GetSectionResponse response;
    ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + deadline_);
    Status status = stub_->GetSection(&context, request, &response);
    if (status.error_code() == grpc::StatusCode::INVALID_ARGUMENT) {
        throw InvalidSectionId(status.error_message());
    }
    ThrowIfError(status, "GetSection(" + section_id + ")");

    absl::MutexLock lock(&mu_);
    if (response.not_modified()) {
        const CachedSection* cached = revalidate_.Find(section_id);
        if (cached == nullptr || cached->etag != response.etag()) {
            // A concurrent caller replaced or evicted the copy the server vouched for.
            throw StorageError("Section " + section_id + " reported unchanged but is not cached");
        }
        VLOG(2) << "Section " << section_id << " not modified";
        NotificationSection section = cached->section;
        if (response.archived() && section_id != kCurrentSectionId) {
            revalidate_.Erase(section_id);
            archived_.Put(section_id, section);
        }
        return section;
    }

    NotificationSection section = FromProto(response.section());
    if (response.archived()) {
        // "current" never names the same section twice.
        if (section_id != kCurrentSectionId) {
            archived_.Put(section_id, section);
        }
        archived_.Put(section.section_id, section);
        revalidate_.Erase(section_id);
    } else {
        revalidate_.Put(section_id, CachedSection{section, response.etag()});
    }
    return section;
}

RemoteLogWriter::RemoteLogWriter(const std::string& server_address,
                                 std::chrono::milliseconds deadline)
    : RemoteLogWriter(grpc::CreateChannel(server_address, grpc::InsecureChannelCredentials()),
                      deadline) {}

RemoteLogWriter::RemoteLogWriter(std::shared_ptr<grpc::Channel> channel,
                                 std::chrono::milliseconds deadline)
    : stub_(LogWriterService::NewStub(channel)), deadline_(deadline) {}

int64_t RemoteLogWriter::Append(const std::string& topic, const std::string& data,
                                const CausalDependencies& causal_dependencies) {
    AppendRequest request;
    request.set_topic(topic);
    request.set_data(data);
    for (const CausalDependency& dependency : causal_dependencies) {
        ToProto(dependency, request.add_causal_dependencies());
    }
    AppendResponse response;
    ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + deadline_);

    ThrowIfError(stub_->Append(&context, request, &response), "Append");
    return response.position();
}

} // namespace Chronicle
