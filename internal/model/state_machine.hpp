#pragma once

#include "coordinator/core/v1/types.pb.h"

namespace coordinator::model {

using coordinator::v1::WorkflowPhase;

constexpr bool IsTerminal(WorkflowPhase phase) {
  return phase == coordinator::v1::WORKFLOW_PHASE_SUCCEEDED || phase == coordinator::v1::WORKFLOW_PHASE_FAILED ||
         phase == coordinator::v1::WORKFLOW_PHASE_ERROR;
}

// Node phases that count towards workflow progress.
constexpr bool IsNodeCompleted(WorkflowPhase phase) {
  return IsTerminal(phase) || phase == coordinator::v1::WORKFLOW_PHASE_SKIPPED;
}

constexpr int Rank(WorkflowPhase phase) {
  switch (phase) {
    case coordinator::v1::WORKFLOW_PHASE_PENDING:
      return 1;
    case coordinator::v1::WORKFLOW_PHASE_RUNNING:
      return 2;
    case coordinator::v1::WORKFLOW_PHASE_SUCCEEDED:
    case coordinator::v1::WORKFLOW_PHASE_FAILED:
    case coordinator::v1::WORKFLOW_PHASE_ERROR:
    case coordinator::v1::WORKFLOW_PHASE_SKIPPED:
      return 3;
    default:
      return 0;
  }
}

/*
  Phases only move forward. A terminal phase never changes again.
*/
constexpr bool CanTransition(WorkflowPhase from, WorkflowPhase to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == coordinator::v1::WORKFLOW_PHASE_UNSPECIFIED) {
    return false;
  }
  return Rank(to) > Rank(from);
}

} // namespace coordinator::model
