#include "platform/platform.hpp"

#include "platform/macos/mac_native_bridge.hpp"
#include "platform/macos/mac_system_manager.hpp"

std::unique_ptr<NativeBridge> make_native_bridge(const Config& /*config*/) {
    return std::make_unique<MacNativeBridge>();
}

std::unique_ptr<SystemManager> make_system_manager(NativeBridge& bridge) {
    return std::make_unique<MacSystemManager>(bridge);
}
