#pragma once

#include "coordinator/core/v1/task.pb.h"
#include "coordinator/core/v1/types.pb.h"
#include "coordinator/core/v1/workflow.pb.h"

#include "coordinator/scaling/v1/scaling.pb.h"

#include "coordinator/admin/v1/stats.pb.h"

#include "coordinator/services/v1/workflow_coordinator_service.pb.h"
#include "coordinator/services/v1/coordinator_admin_service.pb.h"

#include "coordinator/services/v1/workflow_coordinator_service.grpc.pb.h"
#include "coordinator/services/v1/coordinator_admin_service.grpc.pb.h"
