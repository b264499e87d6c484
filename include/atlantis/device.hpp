// include/atlantis/device.hpp
// Device fingerprint and emulator detection.

#pragma once

#include <string>

namespace atlantis {

// Hardware/build identifiers of the device the host application runs on.
struct DeviceInfo {
    std::string fingerprint;
    std::string model;
    std::string manufacturer;
    std::string brand;
    std::string device;
    std::string product;
    std::string hardware;
    std::string os_release;

    // Read the identifiers of the running system. On Android these are the
    // ro.* build properties; elsewhere they come from uname(2).
    static DeviceInfo current();

    // "<manufacturer> <model> (Android <release>)"-style description.
    std::string full_model() const;
};

// True if the identifiers match a known emulator signature. Emulated network
// stacks do not carry multicast reliably, so direct mode is used there.
bool is_emulator(const DeviceInfo& info);

} // namespace atlantis
