#include "http_client.hpp"

#include <curl/curl.h>

#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>

#include "config/config.pb.h"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace coordinator::cluster::kube {

namespace {

std::once_flag g_curl_init;

size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
  if (userp == nullptr || contents == nullptr) {
    return 0;
  }
  userp->append(static_cast<const char*>(contents), size * nmemb);
  return size * nmemb;
}

std::string ReadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot read " + path);
  }
  std::ostringstream out;
  out << in.rdbuf();
  auto token = out.str();
  while (!token.empty() && (token.back() == '\n' || token.back() == '\r')) token.pop_back();
  return token;
}

} // namespace

KubeClientOptions KubeClientOptions::FromConfig(const coordinator::runtime::config::KubernetesConfig& config) {
  KubeClientOptions options;
  if (!config.api_server().empty()) options.api_server = config.api_server();
  if (!config.token_path().empty()) options.bearer_token = ReadFile(config.token_path());
  options.ca_path                  = config.ca_path();
  options.insecure_skip_tls_verify = config.insecure_skip_tls_verify();
  if (config.request_timeout_ms() > 0) options.request_timeout = std::chrono::milliseconds(config.request_timeout_ms());
  if (config.connect_timeout_ms() > 0) options.connect_timeout = std::chrono::milliseconds(config.connect_timeout_ms());
  return options;
}

KubeHttpClient::KubeHttpClient(KubeClientOptions options) : options_(std::move(options)) {
  std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse KubeHttpClient::Request(std::string_view method, const std::string& path, const std::string& body,
                                     std::string_view content_type) const {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    throw util::TransientInfraError("failed to initialize curl");
  }

  const std::string url = options_.api_server + path;
  const std::string verb(method);
  HttpResponse      response;

  observability::SpanScope span("kube " + verb, observability::SpanKind::kClient);
  span.SetAttribute("http.request.method", std::string_view(verb));
  span.SetAttribute("url.path", std::string_view(path));

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options_.request_timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  if (options_.insecure_skip_tls_verify) {
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 0L);
  } else if (!options_.ca_path.empty()) {
    curl_easy_setopt(curl.get(), CURLOPT_CAINFO, options_.ca_path.c_str());
  }

  if (verb == "GET") {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  } else {
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, verb.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  }

  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr, &curl_slist_free_all);
  auto append_header = [&](const std::string& header) { headers.reset(curl_slist_append(headers.release(), header.c_str())); };
  append_header("Accept: application/json");
  if (!body.empty()) append_header("Content-Type: " + std::string(content_type));
  if (!options_.bearer_token.empty()) append_header("Authorization: Bearer " + options_.bearer_token);
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

  const CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    span.RecordException(curl_easy_strerror(res));
    throw util::TransientInfraError(verb + " " + path + " failed: " + curl_easy_strerror(res));
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  span.SetAttribute("http.response.status_code", static_cast<std::int64_t>(response.status));
  return response;
}

void KubeHttpClient::ThrowForStatus(const HttpResponse& response, std::string_view what) {
  if (response.status >= 200 && response.status < 300) {
    return;
  }

  const std::string message = std::string(what) + ": HTTP " + std::to_string(response.status) + " " + response.body.substr(0, 256);
  if (response.status == 404) throw util::NotFound(message);
  if (response.status == 409) throw util::InvalidState(message);
  if (response.status == 429 || response.status >= 500) throw util::TransientInfraError(message);
  if (response.status >= 400) throw util::ValidationError(message);
  throw util::TransientInfraError(message);
}

} // namespace coordinator::cluster::kube
