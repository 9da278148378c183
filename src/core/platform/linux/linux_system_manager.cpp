#include "platform/linux/linux_system_manager.hpp"

#include "bridge_buffer.hpp"

std::optional<std::string> LinuxSystemManager::get_current_window_title() const {
    return read_bridge_string<kIdentifierBufferSize>([this](char* buf, int32_t size) {
        return bridge_.active_window_title(buf, size);
    });
}

std::optional<std::string> LinuxSystemManager::get_current_window_class() const {
    return read_bridge_string<kIdentifierBufferSize>([this](char* buf, int32_t size) {
        return bridge_.active_app_identifier(buf, size);
    });
}

// Executables are resolved through /proc and can be longer than an identifier.
std::optional<std::string> LinuxSystemManager::get_current_window_executable() const {
    return read_bridge_string<kPathBufferSize>([this](char* buf, int32_t size) {
        return bridge_.active_app_bundle(buf, size);
    });
}
