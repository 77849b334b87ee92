#if !defined DEVICE_RESOLVER_HPP
#define DEVICE_RESOLVER_HPP

#include <chrono>
#include <string>

class AddressCache;
class EventLog;
class HostnameLookup;
class IdentityProbe;
class LocalAddressSource;
class ReachabilityProbe;
class ScanCapability;

// Produces the display's address: a known address if it still checks out, else the cached
// one, else whatever a scan of the local /24 turns up
class DeviceResolver
{
public:

    enum Source
    {
        RESOLVED_NONE,
        RESOLVED_KNOWN,
        RESOLVED_CACHED,
        RESOLVED_SCANNED
    };

    // liveness_probe is used to verify single addresses; sweep_probe is used on every address
    // of the /24 when the scanner is unavailable and should therefore be quick
    DeviceResolver(AddressCache&       cache,
                   ScanCapability&     scanner,
                   ReachabilityProbe&  liveness_probe,
                   ReachabilityProbe&  sweep_probe,
                   IdentityProbe&      identity_probe,
                   HostnameLookup&     hostname_lookup,
                   LocalAddressSource& local_address,
                   const std::string&  device_hostname,
                   EventLog&           log);

    ~DeviceResolver();

    // known_address may be empty.  Only a scan result is written to the cache; a scan that
    // finds candidates but cannot verify any of them yields the first candidate.
    Source resolve(const std::string&                           known_address,
                   const std::chrono::system_clock::time_point& now,
                   std::string&                                 address);

    // Reachable, and identifies as a cast device
    bool verify(const std::string& address);

private:

    bool scanNetwork(std::string& address);

    // Used when the scanner cannot run: ping every host, then look for one whose name
    // contains the device hostname
    bool sweepNetwork(const std::string& subnet_prefix, std::string& address);

    // Falls back to the identity probe when the address has no reverse name
    bool matchesDeviceHostname(const std::string& address);

    AddressCache& cache;

    ScanCapability& scanner;

    ReachabilityProbe& liveness_probe;

    ReachabilityProbe& sweep_probe;

    IdentityProbe& identity_probe;

    HostnameLookup& hostname_lookup;

    LocalAddressSource& local_address;

    // Recorded in the cache alongside scanned addresses, and matched during sweeps
    std::string device_hostname;

    EventLog& log;

    DeviceResolver(const DeviceResolver&);
    DeviceResolver& operator=(const DeviceResolver&);
};

#endif
