#include "status_mapping.h"

#include <glog/logging.h>

#include "common/errors.h"

namespace Chronicle {

grpc::Status StatusFromException(const std::exception& e) {
    if (dynamic_cast<const ConcurrencyError*>(&e)) {
        return grpc::Status(grpc::StatusCode::ABORTED, e.what());
    }
    if (dynamic_cast<const SequenceExhausted*>(&e)) {
        return grpc::Status(grpc::StatusCode::OUT_OF_RANGE, e.what());
    }
    if (dynamic_cast<const UnknownTopic*>(&e)) {
        return grpc::Status(grpc::StatusCode::NOT_FOUND, e.what());
    }
    // InvalidPosition and InvalidSectionId both derive from invalid_argument.
    if (dynamic_cast<const std::invalid_argument*>(&e)) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
    }
    if (dynamic_cast<const StorageError*>(&e)) {
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, e.what());
    }
    LOG(ERROR) << "Unexpected error in RPC handler: " << e.what();
    return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
}

void ThrowIfError(const grpc::Status& status, const std::string& what) {
    if (status.ok()) {
        return;
    }
    const std::string message = what + " failed: " + status.error_message();
    switch (status.error_code()) {
        case grpc::StatusCode::ABORTED:
            throw ConcurrencyError(message);
        case grpc::StatusCode::OUT_OF_RANGE:
            throw SequenceExhausted(message);
        case grpc::StatusCode::INVALID_ARGUMENT:
            throw std::invalid_argument(message);
        case grpc::StatusCode::NOT_FOUND:
            throw std::runtime_error(message);
        default:
            // UNAVAILABLE, DEADLINE_EXCEEDED and the rest leave the outcome unknown.
            VLOG(1) << message << " (code " << status.error_code() << ")";
            throw StorageError(message);
    }
}

} // namespace Chronicle
