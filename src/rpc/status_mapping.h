#pragma once

#include <exception>
#include <string>

#include <grpcpp/grpcpp.h>

namespace Chronicle {

// Library exception -> gRPC status, for service handlers.
grpc::Status StatusFromException(const std::exception& e);

// Throws the library exception matching a non-OK status. `what` names the
// call for the error message.
void ThrowIfError(const grpc::Status& status, const std::string& what);

} // namespace Chronicle
