#if !defined DEVICE_RECORD_HPP
#define DEVICE_RECORD_HPP

#include <chrono>
#include <string>

// Everything remembered about the display between runs
struct DeviceRecord
{
    // IPv4 or IPv6 host literal
    std::string address;

    // Hostname the display was configured under when it was recorded
    std::string hostname;

    // Last time the display was discovered at this address
    std::chrono::system_clock::time_point last_seen;
};

#endif
