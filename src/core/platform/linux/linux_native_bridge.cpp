#include "platform/linux/linux_native_bridge.hpp"

#include <climits>
#include <cstring>
#include <format>
#include <unistd.h>

LinuxNativeBridge::LinuxNativeBridge(std::string sway_socket)
    : sway_(std::move(sway_socket)) {}

SwayWindow LinuxNativeBridge::focused_window() {
    std::lock_guard lock(sway_mutex_);
    if (!sway_.connected() && !sway_.connect()) return {};
    return sway_.get_focused_window();
}

int32_t LinuxNativeBridge::active_app_identifier(char* buffer, int32_t size) {
    auto win = focused_window();
    if (win.identifier().empty()) return 0;
    return write_string(win.identifier(), buffer, size);
}

int32_t LinuxNativeBridge::active_app_bundle(char* buffer, int32_t size) {
    auto win = focused_window();
    if (win.pid <= 0) return 0;
    return path_from_pid(win.pid, buffer, size);
}

int32_t LinuxNativeBridge::active_window_title(char* buffer, int32_t size) {
    auto win = focused_window();
    if (win.title.empty()) return 0;
    return write_string(win.title, buffer, size);
}

int32_t LinuxNativeBridge::secure_input_process(int64_t* /*pid*/) {
    return 0;
}

int32_t LinuxNativeBridge::path_from_pid(int64_t pid, char* buffer, int32_t size) {
    if (pid <= 0 || pid > INT_MAX || !buffer || size <= 1) return -1;

    auto link = std::format("/proc/{}/exe", pid);
    ssize_t n = ::readlink(link.c_str(), buffer, static_cast<size_t>(size) - 1);
    // A link that fills the buffer may have been truncated.
    if (n <= 0 || n >= size - 1) return -1;

    buffer[n] = '\0';
    return static_cast<int32_t>(n);
}

int32_t LinuxNativeBridge::write_string(std::string_view value, char* buffer, int32_t size) {
    if (!buffer || size <= 0) return -1;
    if (value.size() + 1 > static_cast<size_t>(size)) return -1;

    std::memcpy(buffer, value.data(), value.size());
    buffer[value.size()] = '\0';
    return static_cast<int32_t>(value.size());
}
