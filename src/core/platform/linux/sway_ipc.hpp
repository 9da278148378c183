#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

struct SwayWindow {
    std::string app_id;        // Wayland app_id (e.g. "kitty")
    std::string window_class;  // X11 class for XWayland windows (e.g. "Firefox")
    std::string title;
    int pid = 0;

    bool empty() const { return app_id.empty() && window_class.empty() && title.empty() && pid == 0; }

    // app_id when the window has one, otherwise its X11 class.
    const std::string& identifier() const { return app_id.empty() ? window_class : app_id; }
};

// Minimal i3-ipc client for focused window lookups. Works against sway and i3.
class SwayIpc {
public:
    // Empty `socket_path` means $SWAYSOCK, then $I3SOCK.
    explicit SwayIpc(std::string socket_path = "");
    ~SwayIpc();

    SwayIpc(const SwayIpc&) = delete;
    SwayIpc& operator=(const SwayIpc&) = delete;

    bool connect();
    bool connected() const { return fd_ >= 0; }
    void disconnect();

    // Empty result when not connected or the tree has no focused window.
    // A failed exchange drops the connection so the next call reconnects.
    SwayWindow get_focused_window();

    static SwayWindow find_focused(const nlohmann::json& node);

private:
    static constexpr char MAGIC[] = "i3-ipc";
    static constexpr size_t HEADER_SIZE = 14;
    static constexpr uint32_t MSG_GET_TREE = 4;

    bool send_message(uint32_t type, const std::string& payload = "");
    bool recv_message(uint32_t& type, std::string& payload);
    std::string resolve_socket_path() const;

    int fd_ = -1;
    std::string socket_path_;
    bool reported_failure_ = false;
};
