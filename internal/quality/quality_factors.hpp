#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "coordinator/core/v1/types.pb.h"

namespace coordinator::quality {

/*
  Inputs to quality assessment. Every score is normalized to [0,1];
  higher means the request deserves (or can afford) more compute.
*/

struct InputComplexity {
  double score = 0.5;
};

struct ResourceAvailability {
  double score = 0.5;
};

struct Subscription {
  double score = 0.25;
};

struct History {
  double score = 0.5;
};

// Only present when the request declares a preference.
struct Preference {
  double score = 0.5;
};

// Anything the closed set does not model; carries its own weight.
struct ExtensionFactor {
  std::string name;
  double      score  = 0.5;
  double      weight = 0.1;
};

using Factor = std::variant<InputComplexity, ResourceAvailability, Subscription, History, Preference, ExtensionFactor>;

std::string_view FactorName(const Factor& factor);
double           FactorScore(const Factor& factor);

// Size and complexity heuristics per request type; 0.5 for unknown types.
double ScoreInputComplexity(const coordinator::v1::WorkflowRequest& request);

double ScoreSubscription(coordinator::v1::SubscriptionTier tier);
double ScorePreference(coordinator::v1::QualityPreference preference);

} // namespace coordinator::quality
