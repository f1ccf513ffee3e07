#pragma once

#include <grpcpp/grpcpp.h>

#include <optional>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace coordinator::grpc {

/*
  Converts internal exceptions into gRPC status codes.

    ValidationError      INVALID_ARGUMENT
    QuotaError           RESOURCE_EXHAUSTED
    TransientInfraError  UNAVAILABLE
    NotFound             NOT_FOUND
    InvalidState         FAILED_PRECONDITION
    anything else        INTERNAL, with a generic message; the detail
                         is logged with the caller's request id
*/
::grpc::Status ToStatus(const std::exception& e);

// Value of the client's x-request-id metadata, empty when absent.
std::string RequestId(const ::grpc::ServerContext* ctx);

/*
  Shared body of every unary handler. A call the client already gave up
  on is answered CANCELLED without running fn; otherwise fn runs with the
  request id (if any) stamped on its log lines and exceptions become
  statuses via ToStatus.
*/
template <typename Fn>
::grpc::Status ServeUnary(::grpc::ServerContext* ctx, Fn&& fn) {
  if (ctx && ctx->IsCancelled()) {
    return {::grpc::StatusCode::CANCELLED, "call cancelled before dispatch"};
  }

  std::optional<observability::LogContext> log_context;
  if (const auto request_id = RequestId(ctx); !request_id.empty()) {
    log_context.emplace(std::initializer_list<observability::LogField>{observability::StringField("request_id", request_id)});
  }

  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace coordinator::grpc
