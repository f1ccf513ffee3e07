#include "status_reconciler.hpp"

#include <algorithm>

#include "google/protobuf/util/time_util.h"
#include "internal/model/names.hpp"
#include "internal/model/state_machine.hpp"

namespace coordinator::workflow {

using google::protobuf::util::TimeUtil;

namespace {

uint32_t NodeProgress(coordinator::v1::WorkflowPhase phase) {
  if (model::IsNodeCompleted(phase)) return 100;
  if (phase == coordinator::v1::WORKFLOW_PHASE_RUNNING) return 50;
  return 0;
}

void SetMillis(google::protobuf::Timestamp* ts, int64_t millis) {
  *ts = TimeUtil::MillisecondsToTimestamp(millis);
}

bool MergeNode(coordinator::v1::WorkflowNode& node, const cluster::EngineNodeStatus& engine) {
  bool changed = false;

  if (engine.phase != node.phase() && model::CanTransition(node.phase(), engine.phase)) {
    node.set_phase(engine.phase);
    changed = true;
  }
  if (!engine.message.empty() && engine.message != node.message()) {
    node.set_message(engine.message);
    changed = true;
  }

  const auto progress = std::max(node.progress(), NodeProgress(node.phase()));
  if (progress != node.progress()) {
    node.set_progress(progress);
    changed = true;
  }

  if (!util::IsSet(node.started_at()) && engine.started_at_ms > 0) {
    SetMillis(node.mutable_started_at(), engine.started_at_ms);
    changed = true;
  }
  if (!util::IsSet(node.finished_at()) && engine.finished_at_ms > 0 && model::IsNodeCompleted(node.phase())) {
    SetMillis(node.mutable_finished_at(), engine.finished_at_ms);
    changed = true;
  }
  return changed;
}

coordinator::v1::WorkflowNode NewNode(const cluster::EngineNodeStatus& engine) {
  coordinator::v1::WorkflowNode node;
  node.set_id(engine.id);
  node.set_name(engine.display_name.empty() ? engine.name : engine.display_name);

  auto stage = model::StageFromName(engine.template_name);
  if (stage == coordinator::v1::PROCESSING_STAGE_UNSPECIFIED) stage = model::StageFromName(node.name());
  node.set_stage(stage);
  node.set_phase(coordinator::v1::WORKFLOW_PHASE_PENDING);
  return node;
}

} // namespace

bool IsGroupingNode(const cluster::EngineNodeStatus& node) {
  return node.type == "DAG" || node.type == "StepGroup" || node.type == "Steps";
}

uint32_t ComputeProgress(const std::vector<cluster::EngineNodeStatus>& nodes) {
  uint32_t total     = 0;
  uint32_t completed = 0;
  for (const auto& node : nodes) {
    if (IsGroupingNode(node)) continue;
    ++total;
    if (model::IsNodeCompleted(node.phase)) ++completed;
  }
  if (total == 0) return 0;
  return completed * 100 / total;
}

google::protobuf::Timestamp EstimateCompletion(const coordinator::v1::WorkflowStatus& status, util::TimePoint now) {
  if (!util::IsSet(status.started_at()) || status.progress() == 0 || status.progress() >= 100) return {};

  const auto started = util::FromProto(status.started_at());
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - started);
  if (elapsed.count() <= 0) return {};

  const auto total = std::chrono::milliseconds(elapsed.count() * 100 / status.progress());
  return util::ToProto(started + total);
}

std::map<std::string, double> StageDurations(const coordinator::v1::WorkflowStatus& status) {
  std::map<std::string, double> out;
  for (const auto& node : status.nodes()) {
    if (node.stage() == coordinator::v1::PROCESSING_STAGE_UNSPECIFIED) continue;
    if (!util::IsSet(node.started_at()) || !util::IsSet(node.finished_at())) continue;

    const auto seconds = std::chrono::duration<double>(util::FromProto(node.finished_at()) - util::FromProto(node.started_at())).count();
    if (seconds > 0) out[std::string(model::ToString(node.stage()))] += seconds;
  }
  return out;
}

bool Reconcile(coordinator::v1::WorkflowStatus& status, const cluster::EngineWorkflowStatus& engine, util::TimePoint now) {
  if (model::IsTerminal(status.status())) return false;

  bool changed = false;

  if (engine.phase != status.status() && model::CanTransition(status.status(), engine.phase)) {
    status.set_status(engine.phase);
    changed = true;
  }

  if (!util::IsSet(status.started_at()) && engine.started_at_ms > 0) {
    SetMillis(status.mutable_started_at(), engine.started_at_ms);
    changed = true;
  }

  // nodes: merge known ones in place, append new ones in start order
  std::vector<const cluster::EngineNodeStatus*> fresh;
  for (const auto& engine_node : engine.nodes) {
    if (IsGroupingNode(engine_node)) continue;

    auto it = std::find_if(status.mutable_nodes()->begin(), status.mutable_nodes()->end(),
                           [&](const coordinator::v1::WorkflowNode& n) { return n.id() == engine_node.id; });
    if (it != status.mutable_nodes()->end()) {
      changed |= MergeNode(*it, engine_node);
    } else {
      fresh.push_back(&engine_node);
    }
  }
  std::stable_sort(fresh.begin(), fresh.end(), [](const auto* a, const auto* b) {
    if ((a->started_at_ms == 0) != (b->started_at_ms == 0)) return b->started_at_ms == 0;
    return a->started_at_ms < b->started_at_ms;
  });
  for (const auto* engine_node : fresh) {
    auto node = NewNode(*engine_node);
    MergeNode(node, *engine_node);
    *status.add_nodes() = std::move(node);
    changed = true;
  }

  uint32_t progress = std::max(status.progress(), ComputeProgress(engine.nodes));
  if (status.status() == coordinator::v1::WORKFLOW_PHASE_SUCCEEDED) progress = 100;
  if (progress != status.progress()) {
    status.set_progress(progress);
    changed = true;
  }

  if (model::IsTerminal(status.status())) {
    if (!engine.message.empty()) status.set_message(engine.message);
    if (engine.finished_at_ms > 0) {
      SetMillis(status.mutable_finished_at(), engine.finished_at_ms);
    } else {
      *status.mutable_finished_at() = util::ToProto(now);
    }
    if (util::IsSet(status.created_at())) {
      const auto duration = util::FromProto(status.finished_at()) - util::FromProto(status.created_at());
      status.set_duration_seconds(std::max(0.0, std::chrono::duration<double>(duration).count()));
    }
    status.clear_estimated_completion();
    return true;
  }

  if (!engine.message.empty() && engine.message != status.message()) {
    status.set_message(engine.message);
    changed = true;
  }

  const auto estimate = EstimateCompletion(status, now);
  if (util::IsSet(estimate)) {
    *status.mutable_estimated_completion() = estimate;
    changed = true;
  }
  return changed;
}

} // namespace coordinator::workflow
