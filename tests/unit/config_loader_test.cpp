#include "internal/config/config_loader.hpp"
#include "internal/observability/spans.hpp"
#include "internal/tasks/task_queue_manager.hpp"

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using coordinator::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "coordinator_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigParses() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
logging:
  level: debug
store:
  sqlite:
    path: /var/lib/coordinator/state.db
kubernetes:
  api_server: https://kubernetes.default.svc
  namespace: ml-workflows
  request_timeout_ms: 5000
execution_engine:
  service_account: workflow-runner
  submit_retry:
    max_attempts: 4
    initial_backoff_ms: 250
  circuit_breaker:
    failure_threshold: 3
quality:
  high_threshold: 0.7
  weights:
    input: 0.4
    subscription: 0.2
resources:
  high:
    cpu: "4"
    memory: 16Gi
    gpu: 2
  low:
    cpu: 500m
features:
  predictive_scaling: true
  scaling_dependencies: true
predictive_scaling:
  forecaster: FORECASTER_KIND_SEASONAL_NAIVE
  season_length: 24
  workloads:
    - name: inference-workers
      workflow_type: room-layout
      max_replicas: 20
      capacity_per_replica: 4
scaling_dependencies:
  workloads:
    - name: inference-workers
      depends_on:
        - workload: feature-store
          ratio: 0.5
    - name: feature-store
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.logging().level() == "debug");
  assert(config.store().has_sqlite());
  assert(config.store().sqlite().path() == "/var/lib/coordinator/state.db");
  assert(config.kubernetes().namespace_() == "ml-workflows");
  assert(config.kubernetes().request_timeout_ms() == 5000);
  assert(config.execution_engine().submit_retry().max_attempts() == 4);
  assert(config.execution_engine().circuit_breaker().failure_threshold() == 3);
  assert(config.quality().weights().input() == 0.4);

  // quoted numbers stay strings, unit suffixes are never numbers
  assert(config.resources().high().cpu() == "4");
  assert(config.resources().high().memory() == "16Gi");
  assert(config.resources().high().gpu() == 2);
  assert(config.resources().low().cpu() == "500m");

  assert(config.features().predictive_scaling());
  assert(!config.features().hpa_event_logging());
  assert(config.predictive_scaling().forecaster() == coordinator::runtime::config::FORECASTER_KIND_SEASONAL_NAIVE);
  assert(config.predictive_scaling().workloads_size() == 1);
  assert(config.predictive_scaling().workloads(0).capacity_per_replica() == 4.0);

  const auto& deps = config.scaling_dependencies();
  assert(deps.workloads_size() == 2);
  assert(deps.workloads(0).depends_on_size() == 1);
  assert(deps.workloads(0).depends_on(0).workload() == "feature-store");
  assert(deps.workloads(0).depends_on(0).ratio() == 0.5);
}

void TestMemoryStoreSelectedByEmptyMap() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(store:
  memory: {}
)");
  assert(config.store().has_memory());
}

void TestScalarEscaping() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(store:
  sqlite:
    path: "C:\\coordinator\\\"quoted\"\\state.db"
server:
  bind_address: "line1\nline2☃"
)");
  assert(config.store().sqlite().path() == "C:\\coordinator\\\"quoted\"\\state.db");
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  assert(Throws([] { ConfigLoader::LoadFromYamlString("unknown_field: 123\n"); }));
  assert(Throws([] {
    ConfigLoader::LoadFromYamlString(R"(predictive_scaling:
  workloads:
    - name: inference-workers
      replicas: 3
)");
  }));
  assert(Throws([] { ConfigLoader::LoadFromYaml("/nonexistent/coordinator.yaml"); }));
}

void TestEnvironmentOverridesFeatures() {
  ::setenv("COORDINATOR_FEATURE_PREDICTIVE_SCALING", "false", 1);
  ::setenv("COORDINATOR_FEATURE_HPA_EVENT_LOGGING", "1", 1);

  const auto config = ConfigLoader::LoadFromYamlString(R"(features:
  predictive_scaling: true
  scaling_dependencies: true
)");
  assert(!config.features().predictive_scaling());
  assert(config.features().scaling_dependencies());
  assert(config.features().hpa_event_logging());

  ::setenv("COORDINATOR_FEATURE_SCALING_DEPENDENCIES", "maybe", 1);
  assert(Throws([] { ConfigLoader::LoadFromYamlString("features: {}\n"); }));

  ::unsetenv("COORDINATOR_FEATURE_PREDICTIVE_SCALING");
  ::unsetenv("COORDINATOR_FEATURE_SCALING_DEPENDENCIES");
  ::unsetenv("COORDINATOR_FEATURE_HPA_EVENT_LOGGING");
}

} // namespace

void TestEnvironmentExpansion() {
  ::setenv("COORDINATOR_TEST_DB_DIR", "/data/coordinator", 1);
  ::unsetenv("COORDINATOR_TEST_UNSET");

  const auto config = ConfigLoader::LoadFromYamlString(R"(store:
  sqlite:
    path: ${COORDINATOR_TEST_DB_DIR}/state.db
kubernetes:
  namespace: ${COORDINATOR_TEST_UNSET:-ml-workflows}
)");
  assert(config.store().sqlite().path() == "/data/coordinator/state.db");
  assert(config.kubernetes().namespace_() == "ml-workflows");

  assert(Throws([] { ConfigLoader::LoadFromYamlString("kubernetes:\n  namespace: ${COORDINATOR_TEST_UNSET}\n"); }));
  assert(Throws([] { ConfigLoader::LoadFromYamlString("kubernetes:\n  namespace: ${COORDINATOR_TEST_DB_DIR\n"); }));
  ::unsetenv("COORDINATOR_TEST_DB_DIR");
}

void TestOutOfRangeValuesAreRejected() {
  assert(Throws([] { ConfigLoader::LoadFromYamlString("quality:\n  high_threshold: 1.5\n"); }));
  assert(Throws([] { ConfigLoader::LoadFromYamlString("quality:\n  high_threshold: 0.4\n  medium_threshold: 0.6\n"); }));
  assert(Throws([] { ConfigLoader::LoadFromYamlString("quality:\n  weights:\n    input: -0.1\n"); }));
  assert(Throws([] { ConfigLoader::LoadFromYamlString("resources:\n  high_load_threshold: 2\n"); }));
  assert(Throws([] { ConfigLoader::LoadFromYamlString("observability:\n  trace_sample_ratio: -1\n"); }));
  assert(Throws([] { ConfigLoader::LoadFromYamlString("store:\n  sqlite: {}\n"); }));
  assert(Throws([] {
    ConfigLoader::LoadFromYamlString("predictive_scaling:\n  forecaster: FORECASTER_KIND_SEASONAL_NAIVE\n  season_length: 24\n  max_signal_samples: 12\n");
  }));

  // unset thresholds fall back to defaults and are not compared
  const auto config = ConfigLoader::LoadFromYamlString("quality:\n  medium_threshold: 0.5\n");
  assert(config.quality().medium_threshold() == 0.5);
}

void TestTracingOptionsFromConfig() {
  using coordinator::observability::OtlpTransport;
  using coordinator::observability::TracingOptionsFromConfig;

  const auto config = ConfigLoader::LoadFromYamlString(R"(store:
  memory: {}
observability:
  otlp_endpoint: "http://collector:4318/v1/traces"
  otlp_transport: OTLP_TRANSPORT_HTTP_PROTOBUF
  trace_sample_ratio: 2.5
kubernetes:
  namespace: ml-workflows
)");
  const auto options = TracingOptionsFromConfig(config);
  assert(options.endpoint == "http://collector:4318/v1/traces");
  assert(options.transport == OtlpTransport::kHttpProtobuf);
  assert(options.service_name == "workflow-coordinator");
  assert(options.kube_namespace == "ml-workflows");
  // ratios above one are clamped
  assert(options.sample_ratio == 1.0);

  const auto sampled = ConfigLoader::LoadFromYamlString(R"(store:
  memory: {}
observability:
  otlp_endpoint: "collector:4317"
  trace_sample_ratio: 0.25
)");
  assert(TracingOptionsFromConfig(sampled).sample_ratio == 0.25);
  assert(TracingOptionsFromConfig(sampled).transport == OtlpTransport::kGrpc);
}

void TestTaskQueueSection() {
  ::setenv("COORDINATOR_FEATURE_TASK_QUEUE", "true", 1);
  const auto config = ConfigLoader::LoadFromYamlString(R"(task_queue:
  dispatch_interval_ms: 100
  high:
    concurrency: 8
    deadline_ms: 30000
  batch:
    rate_limit_per_second: 2
    retry:
      max_attempts: 5
  circuit_breaker:
    failure_threshold: 2
)");
  ::unsetenv("COORDINATOR_FEATURE_TASK_QUEUE");
  assert(config.features().task_queue());

  const auto options = coordinator::tasks::TaskQueueOptions::FromConfig(config.task_queue());
  assert(options.dispatch_interval == std::chrono::milliseconds(100));
  assert(options.lanes[0].concurrency == 8);
  assert(options.lanes[0].rate_limit_per_second == 100);
  assert(options.lanes[0].deadline == std::chrono::milliseconds(30000));
  // untouched lanes keep their defaults
  assert(options.lanes[1].concurrency == 30);
  assert(options.lanes[1].retry.max_attempts == 3);
  assert(options.lanes[3].rate_limit_per_second == 2);
  assert(options.lanes[3].retry.max_attempts == 5);
  assert(options.lanes[3].retry.initial_backoff == std::chrono::milliseconds(10000));
  assert(options.breaker_failure_threshold == 2);
  assert(options.breaker_reset_timeout == std::chrono::milliseconds(60000));

  assert(Throws([] { ConfigLoader::LoadFromYamlString("task_queue:\n  low:\n    retry:\n      multiplier: -2\n"); }));
}

int main() {
  TestFullConfigParses();
  TestMemoryStoreSelectedByEmptyMap();
  TestScalarEscaping();
  TestUnknownFieldsAreRejected();
  TestEnvironmentOverridesFeatures();
  TestEnvironmentExpansion();
  TestOutOfRangeValuesAreRejected();
  TestTracingOptionsFromConfig();
  TestTaskQueueSection();

  std::cout << "coordinator_unit_config_loader: pass\n";
  return 0;
}
