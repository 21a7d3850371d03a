#pragma once

#include "portwatch/core/v1/types.pb.h"
#include "portwatch/services/v1/port_service.pb.h"

namespace portwatch::v1 {
using namespace ::portwatch::core::v1;
using namespace ::portwatch::services::v1;
}
