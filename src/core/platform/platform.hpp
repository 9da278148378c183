#pragma once

#include "config.hpp"
#include "platform/native_bridge.hpp"
#include "system_manager.hpp"

#include <memory>

// Implemented once per target; the build compiles exactly one platform source.
std::unique_ptr<NativeBridge> make_native_bridge(const Config& config);
std::unique_ptr<SystemManager> make_system_manager(NativeBridge& bridge);
