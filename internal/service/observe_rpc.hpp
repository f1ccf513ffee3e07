#pragma once

#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace coordinator::service {

/*
  Runs one RPC body inside a span. Failures are logged with the route and
  rethrown for the transport layer to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view workflow_id, Fn&& fn) {
  observability::SpanScope span(route, observability::SpanKind::kServer);
  span.SetAttribute("rpc.system", std::string_view("grpc"));
  if (!workflow_id.empty()) {
    span.SetAttribute("workflow.id", workflow_id);
  }

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    COORDINATOR_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                         observability::StringField("workflow_id", workflow_id)});
    throw;
  }
}

} // namespace coordinator::service
