#pragma once

#include "autopilot/v1/types.pb.h"

#include "autopilot/v1/analytics_service.pb.h"
#include "autopilot/v1/autonomous_service.pb.h"
#include "autopilot/v1/optimization_service.pb.h"

#include "autopilot/v1/analytics_service.grpc.pb.h"
#include "autopilot/v1/autonomous_service.grpc.pb.h"
#include "autopilot/v1/optimization_service.grpc.pb.h"
