#pragma once

#include "stagegraph/artifact/v1/envelope.pb.h"
#include "stagegraph/config/v1/config.pb.h"
#include "stagegraph/session/v1/session.pb.h"

namespace stagegraph::v1 {
using namespace ::stagegraph::artifact::v1;
using namespace ::stagegraph::config::v1;
using namespace ::stagegraph::session::v1;
}
