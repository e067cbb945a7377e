#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "notification_log.grpc.pb.h"
#include "log/log_writer.h"
#include "notification/notification_log.h"

namespace grpc {
class Channel;
class Server;
class Service;
}

namespace Chronicle {

/**
 * Serves sections of a notification log. Archived sections advertise a long
 * max-age; the current section is revalidated by ETag.
 */
class NotificationLogServiceImpl final : public chronicle::log::NotificationLogService::Service {
public:
    NotificationLogServiceImpl(std::shared_ptr<INotificationLog> log,
                               int64_t archived_max_age_seconds);

    grpc::Status GetSection(grpc::ServerContext* context,
                            const chronicle::log::GetSectionRequest* request,
                            chronicle::log::GetSectionResponse* response) override;

private:
    std::shared_ptr<INotificationLog> log_;
    const int64_t archived_max_age_seconds_;
};

class LogWriterServiceImpl final : public chronicle::log::LogWriterService::Service {
public:
    explicit LogWriterServiceImpl(std::shared_ptr<ILogWriter> writer);

    grpc::Status Append(grpc::ServerContext* context, const chronicle::log::AppendRequest* request,
                        chronicle::log::AppendResponse* response) override;

private:
    std::shared_ptr<ILogWriter> writer_;
};

// Owns a gRPC server for a set of services that outlive it.
class LogServer {
public:
    // port 0 picks a free port; see port().
    LogServer(const std::string& address, int port, const std::vector<grpc::Service*>& services);
    ~LogServer();

    LogServer(const LogServer&) = delete;
    LogServer& operator=(const LogServer&) = delete;

    int port() const { return bound_port_; }

    // Channel that bypasses the network stack.
    std::shared_ptr<grpc::Channel> InProcessChannel();

    void Wait();
    void Shutdown();

private:
    std::unique_ptr<grpc::Server> server_;
    std::thread server_thread_;
    int bound_port_ = 0;
    bool shut_down_ = false;
};

} // namespace Chronicle
