#include "quality_factors.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <charconv>

namespace coordinator::quality {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

enum class Grade { kLow, kMedium, kHigh };

double GradeScore(Grade grade) {
  switch (grade) {
    case Grade::kLow:
      return 0.25;
    case Grade::kHigh:
      return 0.75;
    default:
      return 0.5;
  }
}

double Combine(Grade size, Grade complexity) {
  return (GradeScore(size) + GradeScore(complexity)) / 2.0;
}

const std::string* Param(const coordinator::v1::WorkflowRequest& request, const std::string& key) {
  const auto it = request.parameters().find(key);
  return it == request.parameters().end() ? nullptr : &it->second;
}

// "low" / "medium" / "high"; anything else counts as medium
Grade ParseGrade(const std::string& value) {
  if (value == "low") return Grade::kLow;
  if (value == "high") return Grade::kHigh;
  return Grade::kMedium;
}

// input-images is a JSON array of urls, or a single url
std::size_t CountImages(const std::string& value) {
  if (value.empty()) return 0;
  google::protobuf::ListValue list;
  if (value.front() == '[' && google::protobuf::util::JsonStringToMessage(value, &list).ok()) {
    return static_cast<std::size_t>(list.values_size());
  }
  return 1;
}

double Score3dReconstruction(const coordinator::v1::WorkflowRequest& request) {
  const auto* images = Param(request, "input-images");
  const auto  count  = images ? CountImages(*images) : 1;

  Grade size = Grade::kHigh;
  if (count <= 5) {
    size = Grade::kLow;
  } else if (count <= 20) {
    size = Grade::kMedium;
  }

  Grade complexity = Grade::kMedium;
  if (const auto* scene = Param(request, "scene-complexity")) {
    complexity = ParseGrade(*scene);
  }
  return Combine(size, complexity);
}

double ScoreMaterialRecognition(const coordinator::v1::WorkflowRequest& request) {
  Grade complexity = Grade::kMedium;
  Grade size       = Grade::kMedium;

  if (const auto* extract = Param(request, "extract-properties"); extract && *extract == "true") {
    complexity = Grade::kHigh;
  }
  if (const auto* resolution = Param(request, "image-resolution")) {
    if (*resolution == "hd" || *resolution == "high") {
      size = Grade::kHigh;
    } else if (*resolution == "low") {
      size = Grade::kLow;
    }
  }
  return Combine(size, complexity);
}

double ScoreSceneGraph(const coordinator::v1::WorkflowRequest& request) {
  Grade complexity = Grade::kMedium;
  Grade size       = Grade::kMedium;

  if (const auto* detail = Param(request, "relationship-detail"); detail && *detail == "high") {
    complexity = Grade::kHigh;
  }
  if (const auto* objects = Param(request, "max-objects")) {
    long long  max_objects = 0;
    const auto parsed      = std::from_chars(objects->data(), objects->data() + objects->size(), max_objects);
    if (parsed.ec == std::errc()) {
      if (max_objects <= 10) {
        size = Grade::kLow;
      } else if (max_objects >= 50) {
        size = Grade::kHigh;
      }
    }
  }
  return Combine(size, complexity);
}

double ScoreRoomLayout(const coordinator::v1::WorkflowRequest& request) {
  Grade complexity = Grade::kMedium;
  Grade size       = Grade::kMedium;

  if (const auto* room = Param(request, "room-type")) {
    if (*room == "kitchen" || *room == "bathroom" || *room == "office") {
      complexity = Grade::kHigh;
    } else if (*room == "bedroom" || *room == "living-room") {
      complexity = Grade::kMedium;
    } else {
      complexity = Grade::kLow;
    }
  }
  if (const auto* room_size = Param(request, "room-size")) {
    if (*room_size == "large") {
      size = Grade::kHigh;
    } else if (*room_size == "small") {
      size = Grade::kLow;
    }
  }
  return Combine(size, complexity);
}

} // namespace

std::string_view FactorName(const Factor& factor) {
  return std::visit(Overloaded{[](const InputComplexity&) -> std::string_view { return "input"; },
                               [](const ResourceAvailability&) -> std::string_view { return "resources"; },
                               [](const Subscription&) -> std::string_view { return "subscription"; },
                               [](const History&) -> std::string_view { return "history"; },
                               [](const Preference&) -> std::string_view { return "preference"; },
                               [](const ExtensionFactor& f) -> std::string_view { return f.name; }},
                    factor);
}

double FactorScore(const Factor& factor) {
  return std::clamp(std::visit([](const auto& f) { return f.score; }, factor), 0.0, 1.0);
}

double ScoreInputComplexity(const coordinator::v1::WorkflowRequest& request) {
  const auto& type = request.type();
  if (type == "3d-reconstruction") return Score3dReconstruction(request);
  if (type == "material-recognition") return ScoreMaterialRecognition(request);
  if (type == "scene-graph-generation") return ScoreSceneGraph(request);
  if (type == "room-layout") return ScoreRoomLayout(request);
  return 0.5;
}

double ScoreSubscription(coordinator::v1::SubscriptionTier tier) {
  switch (tier) {
    case coordinator::v1::SUBSCRIPTION_TIER_PREMIUM:
      return 1.0;
    case coordinator::v1::SUBSCRIPTION_TIER_STANDARD:
      return 0.5;
    default:
      return 0.25;
  }
}

double ScorePreference(coordinator::v1::QualityPreference preference) {
  switch (preference) {
    case coordinator::v1::QUALITY_PREFERENCE_QUALITY:
      return 0.8;
    case coordinator::v1::QUALITY_PREFERENCE_SPEED:
      return 0.2;
    default:
      return 0.5;
  }
}

} // namespace coordinator::quality
