#include "grpc_error.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace coordinator::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace coordinator::util;

  if (dynamic_cast<const ValidationError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (const auto* quota = dynamic_cast<const QuotaError*>(&e)) {
    // the ceiling also travels as details so clients need not parse the message
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what(), quota->PermittedCeiling()};
  }
  if (dynamic_cast<const TransientInfraError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }

  // the detail may name files, hosts or queries; it stays in the log
  COORDINATOR_LOG_ERROR("unhandled error in rpc handler", {observability::StringField("error", e.what())});
  return {::grpc::StatusCode::INTERNAL, "internal error"};
}

std::string RequestId(const ::grpc::ServerContext* ctx) {
  if (!ctx) return {};
  const auto& metadata = ctx->client_metadata();
  const auto  it       = metadata.find("x-request-id");
  if (it == metadata.end()) return {};
  return std::string(it->second.data(), it->second.size());
}

} // namespace coordinator::grpc
