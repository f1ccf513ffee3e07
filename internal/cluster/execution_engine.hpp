#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "coordinator/core/v1/types.pb.h"

namespace coordinator::cluster {

/*
  Declarative job handed to the execution engine. The workflow type names
  a template already installed in the engine; the coordinator only fills
  in placement, resources and arguments.
*/
struct JobTemplate {
  std::string                         name;
  std::string                         workflow_type;
  std::string                         entrypoint;
  std::string                         service_account;
  coordinator::v1::ResourceAllocation allocation;
  std::map<std::string, std::string>  labels;
  std::map<std::string, std::string>  arguments;
};

struct EngineNodeStatus {
  std::string                    id;
  std::string                    name;
  std::string                    display_name;
  std::string                    type;
  std::string                    template_name;
  coordinator::v1::WorkflowPhase phase = coordinator::v1::WORKFLOW_PHASE_PENDING;
  std::string                    message;
  int64_t                        started_at_ms  = 0;
  int64_t                        finished_at_ms = 0;
};

struct EngineWorkflowStatus {
  coordinator::v1::WorkflowPhase phase = coordinator::v1::WORKFLOW_PHASE_PENDING;
  std::string                    message;
  int64_t                        started_at_ms  = 0;
  int64_t                        finished_at_ms = 0;
  std::vector<EngineNodeStatus>  nodes;
  // opaque result payload, cached on success
  std::string                    outputs;
};

/*
  External workflow engine.

  Implementations throw util::TransientInfraError when the engine cannot
  be reached, util::NotFound for unknown workflows and
  util::ValidationError when the engine rejects the job.
*/
class ExecutionEngine {
 public:
  virtual ~ExecutionEngine() = default;

  // Idempotent per job name.
  virtual void                 Submit(const JobTemplate& job)               = 0;
  virtual EngineWorkflowStatus Poll(const std::string& workflow_id)         = 0;
  virtual void                 Terminate(const std::string& workflow_id)    = 0;
};

} // namespace coordinator::cluster
