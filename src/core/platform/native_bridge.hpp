#pragma once

#include <cstdint>

// Native window/process queries. Each string call writes a null-terminated
// string into the caller's buffer and returns its length in bytes, or <= 0 when
// there is nothing to report (not found, no permission, buffer too small).
class NativeBridge {
public:
    virtual ~NativeBridge() = default;

    virtual int32_t active_app_identifier(char* buffer, int32_t size) = 0;
    virtual int32_t active_app_bundle(char* buffer, int32_t size) = 0;

    // Returns > 0 and writes `pid` when some process holds secure input.
    virtual int32_t secure_input_process(int64_t* pid) = 0;

    virtual int32_t path_from_pid(int64_t pid, char* buffer, int32_t size) = 0;

    // Not every platform can report a literal window title.
    virtual int32_t active_window_title(char* /*buffer*/, int32_t /*size*/) { return 0; }
};
