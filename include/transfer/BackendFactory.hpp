#pragma once

#include "config/Config.hpp"
#include "transfer/Backend.hpp"

#include <functional>

namespace stratus::transfer {

BackendPtr makeBackend(const types::DriveConfig& drive, const config::TransferConfig& cfg);

using BackendFactory = std::function<BackendPtr(const types::DriveConfig&)>;

}
