#pragma once

#include "config/config.pb.h"
#include "linksync/v1/report.pb.h"

namespace linksync::v1 {
using namespace ::linksync::runtime::config;
}
