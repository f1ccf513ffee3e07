#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace coordinator::runtime::config {
class KubernetesConfig;
}

namespace coordinator::cluster::kube {

struct HttpResponse {
  long        status = 0;
  std::string body;
};

struct KubeClientOptions {
  std::string               api_server{"https://kubernetes.default.svc"};
  std::string               bearer_token;
  std::string               ca_path;
  bool                      insecure_skip_tls_verify{false};
  std::chrono::milliseconds request_timeout{10000};
  std::chrono::milliseconds connect_timeout{3000};

  // Reads the service account token from token_path when set.
  static KubeClientOptions FromConfig(const coordinator::runtime::config::KubernetesConfig& config);
};

/*
  Minimal libcurl client for the Kubernetes API server.

  Transport failures (DNS, connect, timeout) throw TransientInfraError.
  HTTP status is returned as-is; callers use ThrowForStatus.
*/
class KubeHttpClient {
 public:
  explicit KubeHttpClient(KubeClientOptions options);

  HttpResponse Request(std::string_view method, const std::string& path, const std::string& body = {},
                       std::string_view content_type = "application/json") const;

  // 404 NotFound, 409 InvalidState, 429/5xx TransientInfraError, other 4xx ValidationError.
  static void ThrowForStatus(const HttpResponse& response, std::string_view what);

 private:
  KubeClientOptions options_;
};

} // namespace coordinator::cluster::kube
