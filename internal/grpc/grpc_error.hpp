#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace hsm::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace hsm::grpc
