#pragma once

#include "platform/native_bridge.hpp"
#include "system_manager.hpp"

class MacSystemManager : public SystemManager {
public:
    explicit MacSystemManager(NativeBridge& bridge) : bridge_(bridge) {}

    // macOS exposes no per-window title without accessibility access, so the
    // bundle identifier doubles as the title.
    std::optional<std::string> get_current_window_title() const override;
    std::optional<std::string> get_current_window_class() const override;
    std::optional<std::string> get_current_window_executable() const override;

private:
    NativeBridge& bridge_;
};
