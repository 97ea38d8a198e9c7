#pragma once

#include "hsm/status/v1/types.pb.h"
#include "hsm/status/v1/hsm_status_service.pb.h"
