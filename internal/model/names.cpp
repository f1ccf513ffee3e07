#include "names.hpp"

#include <array>
#include <utility>

namespace coordinator::model {

std::optional<WorkflowPhase> ParsePhase(std::string_view phase) {
  if (phase == "Pending") return coordinator::v1::WORKFLOW_PHASE_PENDING;
  if (phase == "Running") return coordinator::v1::WORKFLOW_PHASE_RUNNING;
  if (phase == "Succeeded") return coordinator::v1::WORKFLOW_PHASE_SUCCEEDED;
  if (phase == "Failed") return coordinator::v1::WORKFLOW_PHASE_FAILED;
  if (phase == "Error") return coordinator::v1::WORKFLOW_PHASE_ERROR;
  if (phase == "Skipped" || phase == "Omitted") return coordinator::v1::WORKFLOW_PHASE_SKIPPED;
  return std::nullopt;
}

ProcessingStage StageFromName(std::string_view name) {
  // postprocessing before preprocessing/processing style substrings
  static const std::array<std::pair<std::string_view, ProcessingStage>, 7> kStages = {{
      {"postprocess", coordinator::v1::PROCESSING_STAGE_POSTPROCESSING},
      {"preprocess", coordinator::v1::PROCESSING_STAGE_PREPROCESSING},
      {"prepar", coordinator::v1::PROCESSING_STAGE_PREPARATION},
      {"analy", coordinator::v1::PROCESSING_STAGE_ANALYSIS},
      {"inference", coordinator::v1::PROCESSING_STAGE_INFERENCE},
      {"conver", coordinator::v1::PROCESSING_STAGE_CONVERSION},
      {"cleanup", coordinator::v1::PROCESSING_STAGE_CLEANUP},
  }};

  for (const auto& [needle, stage] : kStages) {
    if (name.find(needle) != std::string_view::npos) {
      return stage;
    }
  }
  return coordinator::v1::PROCESSING_STAGE_UNSPECIFIED;
}

} // namespace coordinator::model
