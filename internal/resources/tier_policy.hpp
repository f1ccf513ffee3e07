#pragma once

#include <map>
#include <string>
#include <vector>

#include "coordinator/core/v1/types.pb.h"

namespace coordinator::resources {

using coordinator::v1::NodePool;
using coordinator::v1::Priority;
using coordinator::v1::QualityLevel;
using coordinator::v1::SubscriptionTier;

/*
  Pure tier rules. Usable without cluster access.

  Unknown or unspecified tiers fail closed: they get the free tier's
  ceiling and node pools.
*/

QualityLevel GetHighestAllowedQuality(SubscriptionTier tier);
bool         IsQualityAllowed(QualityLevel level, SubscriptionTier tier);
QualityLevel ClampToTier(QualityLevel level, SubscriptionTier tier);

std::vector<NodePool> AllowedNodePools(SubscriptionTier tier);
bool                  IsNodePoolAllowed(NodePool pool, SubscriptionTier tier);

NodePool                                      PoolForQuality(QualityLevel level);
std::map<std::string, std::string>            NodeSelectorFor(NodePool pool);
std::vector<coordinator::v1::Toleration>      TolerationsFor(NodePool pool);

// Preemption class handed to the scheduler.
std::string PriorityClassName(Priority priority);

// free 10/0/0, standard 30/20/0, premium 50/40/30 for high/medium/low; zero becomes 10
int32_t GetPriorityValue(QualityLevel level, SubscriptionTier tier);

// Interactive request types run at high priority; otherwise by tier.
Priority DefaultPriority(const coordinator::v1::WorkflowRequest& request);

} // namespace coordinator::resources
