// src/device.cpp
// Device detection.

#include "atlantis/device.hpp"

#include <sys/utsname.h>

#if defined(__ANDROID__)
#include <sys/system_properties.h>
#endif

namespace atlantis {

namespace {

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool contains(const std::string& s, const char* needle) {
    return s.find(needle) != std::string::npos;
}

#if defined(__ANDROID__)
std::string system_property(const char* name) {
    char value[PROP_VALUE_MAX] = {};
    int n = ::__system_property_get(name, value);
    return n > 0 ? std::string(value, static_cast<size_t>(n)) : std::string();
}
#endif

std::string or_unknown(std::string value) {
    return value.empty() ? std::string("Unknown") : value;
}

} // namespace

DeviceInfo DeviceInfo::current() {
    DeviceInfo info;
#if defined(__ANDROID__)
    info.fingerprint = system_property("ro.build.fingerprint");
    info.model = system_property("ro.product.model");
    info.manufacturer = system_property("ro.product.manufacturer");
    info.brand = system_property("ro.product.brand");
    info.device = system_property("ro.product.device");
    info.product = system_property("ro.product.name");
    info.hardware = system_property("ro.hardware");
    info.os_release = system_property("ro.build.version.release");
#else
    struct utsname uts{};
    if (::uname(&uts) == 0) {
        info.model = uts.nodename;
        info.manufacturer = uts.sysname;
        info.hardware = uts.machine;
        info.os_release = uts.release;
        info.fingerprint = std::string(uts.sysname) + "/" + uts.release + "/" + uts.version;
    }
#endif
    info.model = or_unknown(info.model);
    info.manufacturer = or_unknown(info.manufacturer);
    info.os_release = or_unknown(info.os_release);
    return info;
}

std::string DeviceInfo::full_model() const {
#if defined(__ANDROID__)
    return manufacturer + " " + model + " (Android " + os_release + ")";
#else
    return manufacturer + " " + model + " (" + os_release + ")";
#endif
}

bool is_emulator(const DeviceInfo& info) {
    return starts_with(info.fingerprint, "google/sdk_gphone")
        || starts_with(info.fingerprint, "generic")
        || contains(info.model, "Emulator")
        || contains(info.model, "Android SDK built for")
        || contains(info.manufacturer, "Genymotion")
        || starts_with(info.brand, "generic")
        || starts_with(info.device, "generic")
        || info.product == "google_sdk"
        || contains(info.hardware, "ranchu")
        || contains(info.hardware, "goldfish");
}

} // namespace atlantis
