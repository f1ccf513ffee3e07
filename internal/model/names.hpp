#pragma once

#include <optional>
#include <string_view>

#include "coordinator/core/v1/task.pb.h"
#include "coordinator/core/v1/types.pb.h"
#include "coordinator/scaling/v1/scaling.pb.h"

namespace coordinator::model {

using coordinator::v1::NodePool;
using coordinator::v1::Priority;
using coordinator::v1::ProcessingStage;
using coordinator::v1::QualityLevel;
using coordinator::v1::QualityPreference;
using coordinator::v1::QualityTarget;
using coordinator::v1::SubscriptionTier;
using coordinator::v1::WorkflowPhase;

constexpr std::string_view ToString(QualityLevel level) {
  switch (level) {
    case coordinator::v1::QUALITY_LEVEL_LOW:
      return "low";
    case coordinator::v1::QUALITY_LEVEL_MEDIUM:
      return "medium";
    case coordinator::v1::QUALITY_LEVEL_HIGH:
      return "high";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(QualityTarget target) {
  switch (target) {
    case coordinator::v1::QUALITY_TARGET_LOW:
      return "low";
    case coordinator::v1::QUALITY_TARGET_MEDIUM:
      return "medium";
    case coordinator::v1::QUALITY_TARGET_HIGH:
      return "high";
    default:
      return "auto";
  }
}

constexpr std::string_view ToString(SubscriptionTier tier) {
  switch (tier) {
    case coordinator::v1::SUBSCRIPTION_TIER_FREE:
      return "free";
    case coordinator::v1::SUBSCRIPTION_TIER_STANDARD:
      return "standard";
    case coordinator::v1::SUBSCRIPTION_TIER_PREMIUM:
      return "premium";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(Priority priority) {
  switch (priority) {
    case coordinator::v1::PRIORITY_CRITICAL:
      return "critical";
    case coordinator::v1::PRIORITY_HIGH:
      return "high";
    case coordinator::v1::PRIORITY_MEDIUM:
      return "medium";
    case coordinator::v1::PRIORITY_LOW:
      return "low";
    case coordinator::v1::PRIORITY_BACKGROUND:
      return "background";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(QualityPreference preference) {
  switch (preference) {
    case coordinator::v1::QUALITY_PREFERENCE_QUALITY:
      return "quality";
    case coordinator::v1::QUALITY_PREFERENCE_SPEED:
      return "speed";
    case coordinator::v1::QUALITY_PREFERENCE_BALANCED:
      return "balanced";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(NodePool pool) {
  switch (pool) {
    case coordinator::v1::NODE_POOL_GENERAL:
      return "general";
    case coordinator::v1::NODE_POOL_GPU:
      return "gpu";
    case coordinator::v1::NODE_POOL_GPU_HIGHEND:
      return "gpu-highend";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(WorkflowPhase phase) {
  switch (phase) {
    case coordinator::v1::WORKFLOW_PHASE_PENDING:
      return "Pending";
    case coordinator::v1::WORKFLOW_PHASE_RUNNING:
      return "Running";
    case coordinator::v1::WORKFLOW_PHASE_SUCCEEDED:
      return "Succeeded";
    case coordinator::v1::WORKFLOW_PHASE_FAILED:
      return "Failed";
    case coordinator::v1::WORKFLOW_PHASE_ERROR:
      return "Error";
    case coordinator::v1::WORKFLOW_PHASE_SKIPPED:
      return "Skipped";
    default:
      return "Unknown";
  }
}

constexpr std::string_view ToString(ProcessingStage stage) {
  switch (stage) {
    case coordinator::v1::PROCESSING_STAGE_PREPARATION:
      return "preparation";
    case coordinator::v1::PROCESSING_STAGE_ANALYSIS:
      return "analysis";
    case coordinator::v1::PROCESSING_STAGE_PREPROCESSING:
      return "preprocessing";
    case coordinator::v1::PROCESSING_STAGE_INFERENCE:
      return "inference";
    case coordinator::v1::PROCESSING_STAGE_POSTPROCESSING:
      return "postprocessing";
    case coordinator::v1::PROCESSING_STAGE_CONVERSION:
      return "conversion";
    case coordinator::v1::PROCESSING_STAGE_CLEANUP:
      return "cleanup";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(coordinator::v1::ScalingDirection direction) {
  switch (direction) {
    case coordinator::v1::SCALING_DIRECTION_UP:
      return "up";
    case coordinator::v1::SCALING_DIRECTION_DOWN:
      return "down";
    default:
      return "none";
  }
}

constexpr std::string_view ToString(coordinator::v1::ScalingSource source) {
  switch (source) {
    case coordinator::v1::SCALING_SOURCE_PREDICTIVE:
      return "predictive";
    case coordinator::v1::SCALING_SOURCE_DEPENDENCY:
      return "dependency";
    default:
      return "unknown";
  }
}

constexpr std::string_view ToString(coordinator::v1::HpaEventType type) {
  switch (type) {
    case coordinator::v1::HPA_EVENT_TYPE_SCALE_UP:
      return "scale-up";
    case coordinator::v1::HPA_EVENT_TYPE_SCALE_DOWN:
      return "scale-down";
    case coordinator::v1::HPA_EVENT_TYPE_LIMITED_SCALE:
      return "limited-scale";
    default:
      return "no-scale";
  }
}

constexpr std::string_view ToString(coordinator::v1::TaskLane lane) {
  switch (lane) {
    case coordinator::v1::TASK_LANE_HIGH:
      return "high";
    case coordinator::v1::TASK_LANE_MEDIUM:
      return "medium";
    case coordinator::v1::TASK_LANE_LOW:
      return "low";
    case coordinator::v1::TASK_LANE_BATCH:
      return "batch";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(coordinator::v1::TaskPhase phase) {
  switch (phase) {
    case coordinator::v1::TASK_PHASE_QUEUED:
      return "queued";
    case coordinator::v1::TASK_PHASE_DISPATCHING:
      return "dispatching";
    case coordinator::v1::TASK_PHASE_ADMITTED:
      return "admitted";
    case coordinator::v1::TASK_PHASE_FAILED:
      return "failed";
    case coordinator::v1::TASK_PHASE_CANCELLED:
      return "cancelled";
    case coordinator::v1::TASK_PHASE_EXPIRED:
      return "expired";
    default:
      return "unspecified";
  }
}

// Argo phase strings ("Running", "Succeeded", ...).
std::optional<WorkflowPhase> ParsePhase(std::string_view phase);

// Finds a stage name inside a node or template name, e.g. "run-inference".
ProcessingStage StageFromName(std::string_view name);

constexpr QualityLevel ToLevel(QualityTarget target) {
  switch (target) {
    case coordinator::v1::QUALITY_TARGET_LOW:
      return coordinator::v1::QUALITY_LEVEL_LOW;
    case coordinator::v1::QUALITY_TARGET_MEDIUM:
      return coordinator::v1::QUALITY_LEVEL_MEDIUM;
    case coordinator::v1::QUALITY_TARGET_HIGH:
      return coordinator::v1::QUALITY_LEVEL_HIGH;
    default:
      return coordinator::v1::QUALITY_LEVEL_UNSPECIFIED;
  }
}

} // namespace coordinator::model
