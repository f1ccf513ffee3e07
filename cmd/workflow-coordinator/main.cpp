#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using coordinator::factory::Build;
using coordinator::observability::BoolField;
using coordinator::observability::IntField;
using coordinator::observability::StringField;
using coordinator::runtime::Server;

namespace {

constexpr const char* kVersion            = "0.1.0";
constexpr const char* kDefaultBindAddress = "0.0.0.0:50051";

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

void Usage() {
  std::cerr << "Usage: workflow-coordinator [--check-config] [--config] <config.yaml>\n"
               "       workflow-coordinator --version\n"
               "The config path may also come from COORDINATOR_CONFIG.\n";
}

std::string StoreBackend(const coordinator::runtime::config::RuntimeConfig& config) {
  return config.store().has_sqlite() ? "sqlite:" + config.store().sqlite().path() : "memory";
}

// Prints what the coordinator would run with and exits.
int CheckConfig(const coordinator::runtime::config::RuntimeConfig& config) {
  const auto& features = config.features();
  std::cout << "config ok\n"
            << "  bind_address:         " << (config.server().bind_address().empty() ? kDefaultBindAddress : config.server().bind_address())
            << "\n"
            << "  store:                " << StoreBackend(config) << "\n"
            << "  predictive_scaling:   " << (features.predictive_scaling() ? "on" : "off") << "\n"
            << "  scaling_dependencies: " << (features.scaling_dependencies() ? "on" : "off") << "\n"
            << "  hpa_event_logging:    " << (features.hpa_event_logging() ? "on" : "off") << "\n";
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  bool        check_only = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--version") {
      std::cout << "workflow-coordinator " << kVersion << "\n";
      return 0;
    } else if (arg == "--check-config") {
      check_only = true;
    } else if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (!arg.empty() && arg[0] != '-' && config_path.empty()) {
      config_path = arg;
    } else {
      Usage();
      return 1;
    }
  }
  if (config_path.empty()) {
    if (const char* env = std::getenv("COORDINATOR_CONFIG")) config_path = env;
  }
  if (config_path.empty()) {
    Usage();
    return 1;
  }

  coordinator::runtime::config::RuntimeConfig config;
  try {
    config = coordinator::config::ConfigLoader::LoadFromYaml(config_path);
  } catch (const std::exception& e) {
    std::cerr << "invalid config " << config_path << ": " << e.what() << std::endl;
    return 1;
  }
  if (check_only) return CheckConfig(config);

  try {
    coordinator::observability::InitializeLogging(config);
    const bool tracing = coordinator::observability::InitializeTracing(config);

    auto app = Build(config);

    const auto bind_address = config.server().bind_address().empty() ? std::string(kDefaultBindAddress) : config.server().bind_address();
    Server     server(bind_address, std::move(app.grpc_services));

    // handlers go in before Start so an early SIGTERM still shuts down cleanly
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    COORDINATOR_LOG_INFO("workflow coordinator started",
                         {StringField("version", kVersion), StringField("bind_address", bind_address), IntField("port", server.Port()),
                          StringField("store", StoreBackend(config)), BoolField("tracing", tracing),
                          BoolField("predictive_scaling", static_cast<bool>(app.predictive)),
                          BoolField("scaling_dependencies", static_cast<bool>(app.dependencies)),
                          BoolField("hpa_event_logging", static_cast<bool>(app.hpa_logger))});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(250));

    COORDINATOR_LOG_INFO("shutting down workflow coordinator");

    server.Stop();
    coordinator::factory::Shutdown(app);
    coordinator::observability::ShutdownTracing();
    coordinator::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    COORDINATOR_LOG_ERROR("fatal error", {StringField("error", e.what())});
    coordinator::observability::ShutdownTracing();
    coordinator::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
