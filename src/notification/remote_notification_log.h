#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "absl/synchronization/mutex.h"

#include "notification_log.grpc.pb.h"
#include "common/config.h"
#include "common/lru_cache.h"
#include "log/log_writer.h"
#include "notification/notification_log.h"

namespace grpc {
class Channel;
}

namespace Chronicle {

/**
 * Notification log read through NotificationLogService. Archived sections
 * are fetched once and cached; any other section is revalidated by ETag on
 * every request. Both caches hold at most cache_capacity sections and drop
 * the least recently used one. Section size is not disclosed, so readers
 * start from the "first," form.
 */
class RemoteNotificationLog : public INotificationLog {
public:
    RemoteNotificationLog(const std::string& server_address, std::chrono::milliseconds deadline,
                          size_t cache_capacity = kDefaultRemoteCacheSections);
    RemoteNotificationLog(std::shared_ptr<grpc::Channel> channel,
                          std::chrono::milliseconds deadline,
                          size_t cache_capacity = kDefaultRemoteCacheSections);

    NotificationSection GetSection(const std::string& section_id) override;
    std::optional<int64_t> SectionSize() const override { return std::nullopt; }

    // RPCs issued so far.
    int64_t RpcCount() const;
    // Sections held across both caches.
    size_t CachedSectionCount() const;

private:
    struct CachedSection {
        NotificationSection section;
        std::string etag;
    };

    std::unique_ptr<chronicle::log::NotificationLogService::Stub> stub_;
    const std::chrono::milliseconds deadline_;

    mutable absl::Mutex mu_;
    LruCache<std::string, NotificationSection> archived_ ABSL_GUARDED_BY(mu_);
    LruCache<std::string, CachedSection> revalidate_ ABSL_GUARDED_BY(mu_);
    int64_t rpc_count_ ABSL_GUARDED_BY(mu_) = 0;
};

// ILogWriter over LogWriterService.
class RemoteLogWriter : public ILogWriter {
public:
    RemoteLogWriter(const std::string& server_address, std::chrono::milliseconds deadline);
    RemoteLogWriter(std::shared_ptr<grpc::Channel> channel, std::chrono::milliseconds deadline);

    using ILogWriter::Append;
    int64_t Append(const std::string& topic, const std::string& data,
                   const CausalDependencies& causal_dependencies) override;

private:
    std::unique_ptr<chronicle::log::LogWriterService::Stub> stub_;
    const std::chrono::milliseconds deadline_;
};

} // namespace Chronicle
