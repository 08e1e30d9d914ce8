#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace registry::grpc {

/*
  Converts internal exceptions into gRPC status codes.

    NotFound               NOT_FOUND
    Conflict               ALREADY_EXISTS
    IntegrityError         DATA_LOSS
    InvalidState           FAILED_PRECONDITION
    TransientStorageError  UNAVAILABLE
    Cancelled              CANCELLED
    std::invalid_argument  INVALID_ARGUMENT
    anything else          INTERNAL
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace registry::grpc
