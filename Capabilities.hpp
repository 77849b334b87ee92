#if !defined CAPABILITIES_HPP
#define CAPABILITIES_HPP

#include <string>
#include <vector>

// Interfaces to everything outside the supervision logic.  Implementations must not throw and
// must bound the time they take; the adapters in this program do so by running every external
// tool through runCommand().

// Finds hosts on a /24 that have the cast discovery ports open
class ScanCapability
{
public:

    virtual ~ScanCapability() {}

    // subnet_prefix is the first three octets, e.g. "192.168.1".  Returns false if the scan
    // tool could not be run at all; candidates is empty on any failure.
    virtual bool scan(const std::string&        subnet_prefix,
                      std::vector<std::string>& candidates) = 0;
};

// Coarse network-level liveness
class ReachabilityProbe
{
public:

    virtual ~ReachabilityProbe() {}

    virtual bool isReachable(const std::string& address) = 0;
};

// Confirms that an address belongs to the display rather than to some other host
class IdentityProbe
{
public:

    virtual ~IdentityProbe() {}

    virtual bool check(const std::string& address) = 0;
};

// Reverse name lookup
class HostnameLookup
{
public:

    virtual ~HostnameLookup() {}

    virtual bool lookup(const std::string& address, std::string& hostname) = 0;
};

// Textual status dump of the display
class StatusProbe
{
public:

    virtual ~StatusProbe() {}

    virtual bool snapshot(const std::string& address, std::string& status) = 0;
};

// Starts or continues display of a URL on the display
class CastTrigger
{
public:

    virtual ~CastTrigger() {}

    virtual bool cast(const std::string& address, const std::string& url) = 0;
};

// Lifecycle of the local web server whose content gets cast
class ContentEndpoint
{
public:

    virtual ~ContentEndpoint() {}

    // Whether the runtime hosting the server is usable at all
    virtual bool isAvailable() = 0;

    // Idempotent; true if the server was already running or was started
    virtual bool ensureRunning(unsigned short listen_port, const std::string& content_dir) = 0;

    // Best-effort teardown
    virtual void cleanup() = 0;
};

// Address this host uses for outbound traffic
class LocalAddressSource
{
public:

    virtual ~LocalAddressSource() {}

    virtual bool getLocalAddress(std::string& address) = 0;
};

#endif
