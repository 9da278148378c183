#pragma once

#include "platform/native_bridge.hpp"
#include "system_manager.hpp"

class LinuxSystemManager : public SystemManager {
public:
    explicit LinuxSystemManager(NativeBridge& bridge) : bridge_(bridge) {}

    std::optional<std::string> get_current_window_title() const override;
    std::optional<std::string> get_current_window_class() const override;
    std::optional<std::string> get_current_window_executable() const override;

private:
    NativeBridge& bridge_;
};
