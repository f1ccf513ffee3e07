#include "argo_engine.hpp"

#include <google/protobuf/struct.pb.h>

#include "internal/model/names.hpp"
#include "internal/util/errors.hpp"
#include "json.hpp"

namespace coordinator::cluster::kube {

namespace {

constexpr const char* kGpuResource = "nvidia.com/gpu";

void AddParameter(google::protobuf::ListValue& parameters, const std::string& name, const std::string& value) {
  auto* parameter = parameters.add_values()->mutable_struct_value();
  SetString(*parameter, "name", name);
  SetString(*parameter, "value", value);
}

} // namespace

ArgoEngine::ArgoEngine(std::shared_ptr<KubeHttpClient> client, std::string ns) : client_(std::move(client)), namespace_(std::move(ns)) {
  if (namespace_.empty()) namespace_ = "default";
}

std::string ArgoEngine::CollectionPath() const {
  return "/apis/argoproj.io/v1alpha1/namespaces/" + namespace_ + "/workflows";
}

google::protobuf::Struct ArgoEngine::BuildManifest(const JobTemplate& job, const std::string& ns) {
  google::protobuf::Struct manifest;
  SetString(manifest, "apiVersion", "argoproj.io/v1alpha1");
  SetString(manifest, "kind", "Workflow");

  auto* metadata = MutableObject(manifest, "metadata");
  SetString(*metadata, "name", job.name);
  SetString(*metadata, "namespace", ns);
  auto* labels = MutableObject(*metadata, "labels");
  for (const auto& [key, value] : job.labels) {
    SetString(*labels, key, value);
  }

  auto* spec = MutableObject(manifest, "spec");
  SetString(*MutableObject(*spec, "workflowTemplateRef"), "name", job.workflow_type);
  if (!job.entrypoint.empty()) SetString(*spec, "entrypoint", job.entrypoint);
  if (!job.service_account.empty()) SetString(*spec, "serviceAccountName", job.service_account);

  const auto& allocation = job.allocation;
  if (!allocation.priority_class().empty()) SetString(*spec, "podPriorityClassName", allocation.priority_class());
  SetNumber(*spec, "podPriority", allocation.priority_value());

  auto* node_selector = MutableObject(*spec, "nodeSelector");
  for (const auto& [key, value] : allocation.node_selector()) {
    SetString(*node_selector, key, value);
  }

  auto* tolerations = (*spec->mutable_fields())["tolerations"].mutable_list_value();
  for (const auto& toleration : allocation.tolerations()) {
    auto* entry = tolerations->add_values()->mutable_struct_value();
    SetString(*entry, "key", toleration.key());
    SetString(*entry, "operator", toleration.operator_());
    if (!toleration.value().empty()) SetString(*entry, "value", toleration.value());
    SetString(*entry, "effect", toleration.effect());
  }

  auto* resources = MutableObject(*MutableObject(*MutableObject(*spec, "templateDefaults"), "container"), "resources");
  auto* requests  = MutableObject(*resources, "requests");
  auto* limits    = MutableObject(*resources, "limits");
  SetString(*requests, "cpu", allocation.cpu());
  SetString(*requests, "memory", allocation.memory());
  SetString(*limits, "cpu", allocation.cpu());
  SetString(*limits, "memory", allocation.memory());
  if (allocation.gpu() > 0) {
    SetString(*requests, kGpuResource, std::to_string(allocation.gpu()));
    SetString(*limits, kGpuResource, std::to_string(allocation.gpu()));
  }

  auto* parameters = (*MutableObject(*spec, "arguments")->mutable_fields())["parameters"].mutable_list_value();
  for (const auto& [name, value] : job.arguments) {
    AddParameter(*parameters, name, value);
  }

  return manifest;
}

EngineWorkflowStatus ArgoEngine::ParseStatus(const google::protobuf::Struct& workflow) {
  EngineWorkflowStatus status;

  const auto phase = GetString(workflow, {"status", "phase"});
  status.phase          = model::ParsePhase(phase).value_or(coordinator::v1::WORKFLOW_PHASE_PENDING);
  status.message        = GetString(workflow, {"status", "message"});
  status.started_at_ms  = GetTimeMillis(workflow, {"status", "startedAt"});
  status.finished_at_ms = GetTimeMillis(workflow, {"status", "finishedAt"});

  if (const auto* outputs = Find(workflow, {"status", "outputs"})) {
    status.outputs = ToJson(*outputs);
  }

  if (const auto* nodes = Find(workflow, {"status", "nodes"}); nodes && nodes->has_struct_value()) {
    for (const auto& [id, value] : nodes->struct_value().fields()) {
      if (!value.has_struct_value()) continue;
      const auto& node = value.struct_value();

      EngineNodeStatus entry;
      entry.id             = GetString(node, {"id"}, id);
      entry.name           = GetString(node, {"name"});
      entry.display_name   = GetString(node, {"displayName"}, entry.name);
      entry.type           = GetString(node, {"type"});
      entry.template_name  = GetString(node, {"templateName"});
      entry.phase          = model::ParsePhase(GetString(node, {"phase"})).value_or(coordinator::v1::WORKFLOW_PHASE_PENDING);
      entry.message        = GetString(node, {"message"});
      entry.started_at_ms  = GetTimeMillis(node, {"startedAt"});
      entry.finished_at_ms = GetTimeMillis(node, {"finishedAt"});
      status.nodes.push_back(std::move(entry));
    }
  }

  return status;
}

void ArgoEngine::Submit(const JobTemplate& job) {
  const auto response = client_->Request("POST", CollectionPath(), ToJson(BuildManifest(job, namespace_)));

  // a retried submit whose first attempt landed
  if (response.status == 409) {
    return;
  }
  KubeHttpClient::ThrowForStatus(response, "submit workflow " + job.name);
}

EngineWorkflowStatus ArgoEngine::Poll(const std::string& workflow_id) {
  const auto response = client_->Request("GET", CollectionPath() + "/" + workflow_id);
  KubeHttpClient::ThrowForStatus(response, "get workflow " + workflow_id);
  return ParseStatus(ParseObject(response.body));
}

void ArgoEngine::Terminate(const std::string& workflow_id) {
  const auto response =
      client_->Request("PATCH", CollectionPath() + "/" + workflow_id, R"({"spec":{"shutdown":"Terminate"}})", "application/merge-patch+json");
  KubeHttpClient::ThrowForStatus(response, "terminate workflow " + workflow_id);
}

} // namespace coordinator::cluster::kube
