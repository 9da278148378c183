#pragma once

#include "platform/linux/sway_ipc.hpp"
#include "platform/native_bridge.hpp"

#include <mutex>
#include <string>
#include <string_view>

// Foreground queries through the sway/i3 IPC socket and /proc.
// Linux has no secure input facility, so no process ever holds it.
class LinuxNativeBridge : public NativeBridge {
public:
    explicit LinuxNativeBridge(std::string sway_socket = "");

    int32_t active_app_identifier(char* buffer, int32_t size) override;
    int32_t active_app_bundle(char* buffer, int32_t size) override;
    int32_t secure_input_process(int64_t* pid) override;
    int32_t path_from_pid(int64_t pid, char* buffer, int32_t size) override;
    int32_t active_window_title(char* buffer, int32_t size) override;

    // Copies `value` plus terminator into `buffer`; -1 when it does not fit.
    static int32_t write_string(std::string_view value, char* buffer, int32_t size);

private:
    SwayWindow focused_window();

    // Serializes connect and the request/reply exchange on the one socket.
    std::mutex sway_mutex_;
    SwayIpc sway_;
};
