#if !defined NETWORK_INFO_HPP
#define NETWORK_INFO_HPP

#include <chrono>
#include <string>

#include "Capabilities.hpp"

namespace networkInfo
{
    // True if address is a literal IPv4 or IPv6 host address
    bool isValidHostAddress(const std::string& address);

    // Produces "a.b.c" from IPv4 address "a.b.c.d"; false for anything else
    bool subnetPrefix24(const std::string& address, std::string& prefix);
}

// Learns the outbound address by connecting a UDP socket toward a public address; nothing is
// actually sent
class RoutingLocalAddress : public LocalAddressSource
{
public:

    RoutingLocalAddress();

    virtual ~RoutingLocalAddress();

    virtual bool getLocalAddress(std::string& address);
};

// Reverse lookups run on a worker thread; a lookup that outlasts the timeout is abandoned and
// reported as a failure
class ReverseDnsLookup : public HostnameLookup
{
public:

    typedef bool (*ResolveFunction)(const std::string& address, std::string& hostname);

    explicit ReverseDnsLookup(
        const std::chrono::milliseconds& timeout  = std::chrono::milliseconds(2000),
        ResolveFunction                  resolver = resolveWithSystem);

    virtual ~ReverseDnsLookup();

    virtual bool lookup(const std::string& address, std::string& hostname);

    // getnameinfo with NI_NAMEREQD; blocks for as long as the system resolver does
    static bool resolveWithSystem(const std::string& address, std::string& hostname);

private:

    std::chrono::milliseconds timeout;

    ResolveFunction resolver;
};

#endif
