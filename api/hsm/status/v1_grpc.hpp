#pragma once

#include "hsm/status/v1.hpp"
#include "hsm/status/v1/hsm_status_service.grpc.pb.h"
