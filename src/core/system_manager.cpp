#include "system_manager.hpp"

std::optional<WindowIdentity> SystemManager::get_current_window() const {
    auto window_class = get_current_window_class();
    auto executable = get_current_window_executable();
    if (!window_class && !executable) return std::nullopt;

    return WindowIdentity{
        .window_class = window_class.value_or(""),
        .executable = executable.value_or(""),
    };
}
