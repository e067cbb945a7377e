#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "counter.grpc.pb.h"
#include "sequencer/integer_sequencer.h"

namespace grpc {
class Channel;
class Server;
}

namespace Chronicle {

/**
 * Named atomic counters served over gRPC. Counters live in memory only, so a
 * restarted service starts every counter again at zero; the distributed
 * sequencer detects that against storage.
 */
class CounterServiceImpl final : public chronicle::counter::CounterService::Service {
public:
    grpc::Status Increment(grpc::ServerContext* context,
                           const chronicle::counter::IncrementRequest* request,
                           chronicle::counter::CounterValue* response) override;

    grpc::Status AdvanceTo(grpc::ServerContext* context,
                           const chronicle::counter::AdvanceToRequest* request,
                           chronicle::counter::CounterValue* response) override;

    // Current value of a counter, 0 if it was never touched.
    int64_t Value(const std::string& name) const;

private:
    mutable absl::Mutex mu_;
    absl::flat_hash_map<std::string, int64_t> counters_ ABSL_GUARDED_BY(mu_);
};

// Owns a gRPC server running CounterServiceImpl on a background thread.
class CounterServer {
public:
    // port 0 picks a free port; see port().
    CounterServer(const std::string& address, int port);
    ~CounterServer();

    CounterServer(const CounterServer&) = delete;
    CounterServer& operator=(const CounterServer&) = delete;

    int port() const { return bound_port_; }
    CounterServiceImpl& service() { return *service_; }

    // Channel that bypasses the network stack.
    std::shared_ptr<grpc::Channel> InProcessChannel();

    void Wait();
    void Shutdown();

private:
    std::unique_ptr<CounterServiceImpl> service_;
    std::unique_ptr<grpc::Server> server_;
    std::thread server_thread_;
    int bound_port_ = 0;
    bool shut_down_ = false;
};

/**
 * ICounterClient over the CounterService stub. RPC failures surface as
 * StorageError, overflow as SequenceExhausted.
 */
class GrpcCounterClient : public ICounterClient {
public:
    GrpcCounterClient(const std::string& server_address, std::string counter_name,
                      std::chrono::milliseconds deadline);
    GrpcCounterClient(std::shared_ptr<grpc::Channel> channel, std::string counter_name,
                      std::chrono::milliseconds deadline);

    int64_t Increment() override;
    int64_t AdvanceTo(int64_t floor) override;

private:
    std::unique_ptr<chronicle::counter::CounterService::Stub> stub_;
    const std::string counter_name_;
    const std::chrono::milliseconds deadline_;
};

} // namespace Chronicle
