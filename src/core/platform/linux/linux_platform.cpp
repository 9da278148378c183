#include "platform/platform.hpp"

#include "platform/linux/linux_native_bridge.hpp"
#include "platform/linux/linux_system_manager.hpp"

std::unique_ptr<NativeBridge> make_native_bridge(const Config& config) {
    return std::make_unique<LinuxNativeBridge>(config.sway.socket);
}

std::unique_ptr<SystemManager> make_system_manager(NativeBridge& bridge) {
    return std::make_unique<LinuxSystemManager>(bridge);
}
