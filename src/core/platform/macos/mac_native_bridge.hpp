#pragma once

#include "platform/native_bridge.hpp"

// Front process and secure input queries through Carbon, IOKit and libproc.
class MacNativeBridge : public NativeBridge {
public:
    int32_t active_app_identifier(char* buffer, int32_t size) override;
    int32_t active_app_bundle(char* buffer, int32_t size) override;
    int32_t secure_input_process(int64_t* pid) override;
    int32_t path_from_pid(int64_t pid, char* buffer, int32_t size) override;
};
