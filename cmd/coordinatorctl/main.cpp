#include <grpcpp/grpcpp.h>

#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "coordinator/v1.hpp"

using namespace coordinator::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  coordinatorctl <addr> create <type> <user_id> [tier=free|standard|premium] [quality=auto|low|medium|high] [key=value...]\n"
            << "  coordinatorctl <addr> enqueue <type> <user_id> [tier] [quality] [key=value...]\n"
            << "  coordinatorctl <addr> get <workflow_id>\n"
            << "  coordinatorctl <addr> cancel <workflow_id>\n"
            << "  coordinatorctl <addr> task-get|task-cancel <task_id>\n"
            << "  coordinatorctl <addr> list [user_id]\n"
            << "  coordinatorctl <addr> invalidate key|type <value>\n"
            << "  coordinatorctl <addr> signal <workload> <value> [metric]\n"
            << "  coordinatorctl <addr> stats\n"
            << "  coordinatorctl <addr> health\n"
            << "  coordinatorctl <addr> ready\n"
            << "  coordinatorctl <addr> metrics\n";
}

static std::optional<SubscriptionTier> ParseTier(const std::string& value) {
  if (value == "free") return SUBSCRIPTION_TIER_FREE;
  if (value == "standard") return SUBSCRIPTION_TIER_STANDARD;
  if (value == "premium") return SUBSCRIPTION_TIER_PREMIUM;
  return std::nullopt;
}

static std::optional<QualityTarget> ParseQuality(const std::string& value) {
  if (value == "auto") return QUALITY_TARGET_AUTO;
  if (value == "low") return QUALITY_TARGET_LOW;
  if (value == "medium") return QUALITY_TARGET_MEDIUM;
  if (value == "high") return QUALITY_TARGET_HIGH;
  return std::nullopt;
}

static std::string ToJson(const google::protobuf::Message& message) {
  std::string                            out;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  if (!google::protobuf::util::MessageToJsonString(message, &out, options).ok()) {
    return message.ShortDebugString();
  }
  return out;
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto workflow_stub = WorkflowCoordinatorService::NewStub(channel);
  auto admin_stub    = CoordinatorAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "create" || cmd == "enqueue") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    CreateWorkflowRequest req;
    auto&                 request = *req.mutable_request();
    request.set_type(argv[3]);
    request.set_user_id(argv[4]);
    request.set_subscription_tier(SUBSCRIPTION_TIER_FREE);

    int next = 5;
    if (argc > next) {
      auto tier = ParseTier(argv[next]);
      if (!tier) {
        std::cerr << "unsupported tier: " << argv[next] << "\n";
        return 1;
      }
      request.set_subscription_tier(*tier);
      ++next;
    }
    if (argc > next && std::string(argv[next]).find('=') == std::string::npos) {
      auto quality = ParseQuality(argv[next]);
      if (!quality) {
        std::cerr << "unsupported quality: " << argv[next] << "\n";
        return 1;
      }
      request.set_quality_target(*quality);
      ++next;
    }
    for (; next < argc; ++next) {
      const std::string arg = argv[next];
      const auto        eq  = arg.find('=');
      if (eq == std::string::npos || eq == 0) {
        std::cerr << "parameters must be key=value: " << arg << "\n";
        return 1;
      }
      (*request.mutable_parameters())[arg.substr(0, eq)] = arg.substr(eq + 1);
    }

    if (cmd == "enqueue") {
      SubmitTaskRequest task_req;
      *task_req.mutable_request() = request;
      SubmitTaskResponse task_resp;
      auto               status = workflow_stub->SubmitTask(&ctx, task_req, &task_resp);
      if (!status.ok()) return Fail(status);

      std::cout << ToJson(task_resp.task()) << "\n";
      return 0;
    }

    CreateWorkflowResponse resp;
    auto                   status = workflow_stub->CreateWorkflow(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "workflow_id=" << resp.workflow_id() << " cache_hit=" << (resp.cache_hit() ? "true" : "false") << "\n";
    std::cout << ToJson(resp.status()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get" || cmd == "cancel") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    WorkflowStatus out;
    grpc::Status   status;
    if (cmd == "get") {
      GetWorkflowRequest req;
      req.set_workflow_id(argv[3]);
      GetWorkflowResponse resp;
      status = workflow_stub->GetWorkflow(&ctx, req, &resp);
      out    = resp.status();
    } else {
      CancelWorkflowRequest req;
      req.set_workflow_id(argv[3]);
      CancelWorkflowResponse resp;
      status = workflow_stub->CancelWorkflow(&ctx, req, &resp);
      out    = resp.status();
    }
    if (!status.ok()) return Fail(status);

    std::cout << ToJson(out) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "task-get" || cmd == "task-cancel") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    AdmissionTask out;
    grpc::Status  status;
    if (cmd == "task-get") {
      GetTaskRequest req;
      req.set_task_id(argv[3]);
      GetTaskResponse resp;
      status = workflow_stub->GetTask(&ctx, req, &resp);
      out    = resp.task();
    } else {
      CancelTaskRequest req;
      req.set_task_id(argv[3]);
      CancelTaskResponse resp;
      status = workflow_stub->CancelTask(&ctx, req, &resp);
      out    = resp.task();
    }
    if (!status.ok()) return Fail(status);

    std::cout << ToJson(out) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListActiveWorkflowsRequest req;
    if (argc >= 4) req.set_user_id(argv[3]);

    ListActiveWorkflowsResponse resp;
    auto                        status = workflow_stub->ListActiveWorkflows(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& wf : resp.workflows()) {
      std::cout << wf.id() << " type=" << wf.type() << " user=" << wf.user_id() << " phase=" << WorkflowPhase_Name(wf.status())
                << " progress=" << wf.progress() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "invalidate") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    InvalidateCacheRequest req;
    const std::string      kind = argv[3];
    if (kind == "key") {
      req.set_cache_key(argv[4]);
    } else if (kind == "type") {
      req.set_workflow_type(argv[4]);
    } else {
      std::cerr << "invalidate expects key or type, got: " << kind << "\n";
      return 1;
    }

    InvalidateCacheResponse resp;
    auto                    status = workflow_stub->InvalidateCache(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "removed=" << resp.removed() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "signal") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    RecordScalingSignalRequest req;
    auto&                      signal = *req.mutable_signal();
    signal.set_workload(argv[3]);
    signal.set_value(std::strtod(argv[4], nullptr));
    if (argc >= 6) signal.set_metric(argv[5]);
    signal.set_timestamp_ms(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());

    RecordScalingSignalResponse resp;
    auto                        status = admin_stub->RecordScalingSignal(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "recorded\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsResponse resp;
    auto          status = admin_stub->Stats(&ctx, StatsRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << ToJson(resp) << "\n";
    return 0;
  }

  if (cmd == "health") {
    HealthResponse resp;
    auto           status = admin_stub->Health(&ctx, HealthRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.ok() ? "ok" : "not ok") << " " << resp.status() << "\n";
    return resp.ok() ? 0 : 3;
  }

  if (cmd == "ready") {
    ReadyResponse resp;
    auto          status = admin_stub->Ready(&ctx, ReadyRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.ready() ? "ready" : "not ready") << "\n";
    for (const auto& reason : resp.reasons()) std::cout << "  " << reason << "\n";
    return resp.ready() ? 0 : 3;
  }

  if (cmd == "metrics") {
    ScrapeMetricsResponse resp;
    auto                  status = admin_stub->ScrapeMetrics(&ctx, ScrapeMetricsRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.body();
    return 0;
  }

  Usage();
  return 1;
}
