#include "platform/macos/mac_native_bridge.hpp"

#include <Carbon/Carbon.h>
#include <CoreFoundation/CoreFoundation.h>
#include <IOKit/IOKitLib.h>
#include <libproc.h>

#include <cstring>

namespace {

#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"

// Writes `key` of the front process's information dictionary as UTF-8.
int32_t copy_front_process_string(CFStringRef key, char* buffer, int32_t size) {
    ProcessSerialNumber psn{};
    if (GetFrontProcess(&psn) != noErr) return -1;

    CFDictionaryRef info = ProcessInformationCopyDictionary(
        &psn, kProcessDictionaryIncludeAllInformationMask);
    if (!info) return -1;

    int32_t result = 0;
    auto value = static_cast<CFStringRef>(CFDictionaryGetValue(info, key));
    if (value && CFGetTypeID(value) == CFStringGetTypeID()) {
        if (CFStringGetCString(value, buffer, size, kCFStringEncodingUTF8)) {
            result = static_cast<int32_t>(std::strlen(buffer));
        } else {
            result = -1;  // does not fit
        }
    }

    CFRelease(info);
    return result;
}

#pragma clang diagnostic pop

} // namespace

int32_t MacNativeBridge::active_app_identifier(char* buffer, int32_t size) {
    return copy_front_process_string(kCFBundleIdentifierKey, buffer, size);
}

int32_t MacNativeBridge::active_app_bundle(char* buffer, int32_t size) {
    return copy_front_process_string(CFSTR("BundlePath"), buffer, size);
}

// The window server publishes the secure input owner on the console user
// session entries of the IOKit registry root.
int32_t MacNativeBridge::secure_input_process(int64_t* pid) {
    if (!pid) return -1;

    io_registry_entry_t root = IORegistryGetRootEntry(MACH_PORT_NULL);
    if (root == MACH_PORT_NULL) return -1;

    CFTypeRef users = IORegistryEntryCreateCFProperty(
        root, CFSTR("IOConsoleUsers"), kCFAllocatorDefault, 0);
    IOObjectRelease(root);
    if (!users) return 0;

    int32_t result = 0;
    if (CFGetTypeID(users) == CFArrayGetTypeID()) {
        auto sessions = static_cast<CFArrayRef>(users);
        for (CFIndex i = 0; i < CFArrayGetCount(sessions) && result == 0; i++) {
            auto session = static_cast<CFDictionaryRef>(CFArrayGetValueAtIndex(sessions, i));
            if (!session || CFGetTypeID(session) != CFDictionaryGetTypeID()) continue;

            auto number = static_cast<CFNumberRef>(
                CFDictionaryGetValue(session, CFSTR("kCGSSessionSecureInputPID")));
            if (!number || CFGetTypeID(number) != CFNumberGetTypeID()) continue;

            int64_t value = 0;
            if (CFNumberGetValue(number, kCFNumberSInt64Type, &value) && value > 0) {
                *pid = value;
                result = 1;
            }
        }
    }

    CFRelease(users);
    return result;
}

int32_t MacNativeBridge::path_from_pid(int64_t pid, char* buffer, int32_t size) {
    if (pid <= 0 || !buffer || size < PROC_PIDPATHINFO_MAXSIZE) return -1;
    int n = proc_pidpath(static_cast<int>(pid), buffer, static_cast<uint32_t>(size));
    return n > 0 ? n : -1;
}
