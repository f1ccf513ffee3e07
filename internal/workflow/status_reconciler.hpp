#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "coordinator/core/v1/workflow.pb.h"
#include "internal/cluster/execution_engine.hpp"
#include "internal/util/time.hpp"

namespace coordinator::workflow {

/*
  Merges engine observations into a WorkflowStatus.

  The merge is monotonic: phases only move forward, progress never
  decreases, node progress never decreases and a terminal status is never
  touched again. Engine reports that would move backwards are ignored.

  Returns true when `status` changed.
*/
bool Reconcile(coordinator::v1::WorkflowStatus& status, const cluster::EngineWorkflowStatus& engine, util::TimePoint now);

// Grouping nodes (DAG, StepGroup, Steps) carry no work of their own.
bool IsGroupingNode(const cluster::EngineNodeStatus& node);

// completed / total over non-grouping nodes, 0..100
uint32_t ComputeProgress(const std::vector<cluster::EngineNodeStatus>& nodes);

// started + elapsed * 100 / progress; unset while progress is 0 or 100
google::protobuf::Timestamp EstimateCompletion(const coordinator::v1::WorkflowStatus& status, util::TimePoint now);

// Seconds spent per ProcessingStage, summed over finished nodes.
std::map<std::string, double> StageDurations(const coordinator::v1::WorkflowStatus& status);

} // namespace coordinator::workflow
