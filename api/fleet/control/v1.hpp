#pragma once

#include "fleet/control/v1/types.pb.h"
#include "fleet/control/v1/services.pb.h"
#include "fleet/control/v1/services.grpc.pb.h"

namespace fleet::control::v1 {
// Generated types and service stubs live directly in this namespace.
}
