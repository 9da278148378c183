#include "platform/macos/mac_system_manager.hpp"

#include "bridge_buffer.hpp"

std::optional<std::string> MacSystemManager::get_current_window_title() const {
    return get_current_window_class();
}

std::optional<std::string> MacSystemManager::get_current_window_class() const {
    return read_bridge_string<kIdentifierBufferSize>([this](char* buf, int32_t size) {
        return bridge_.active_app_identifier(buf, size);
    });
}

std::optional<std::string> MacSystemManager::get_current_window_executable() const {
    return read_bridge_string<kIdentifierBufferSize>([this](char* buf, int32_t size) {
        return bridge_.active_app_bundle(buf, size);
    });
}
