#pragma once

#include "fetchbox/jobs/v1/task.pb.h"

#include "fetchbox/admin/v1/admin_service.pb.h"
#include "fetchbox/admin/v1/admin_service.grpc.pb.h"

namespace fetchbox::v1 {
using namespace ::fetchbox::jobs::v1;
using namespace ::fetchbox::admin::v1;
}
