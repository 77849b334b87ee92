#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>
#include <string>
#include <vector>

#include "DeviceResolver.hpp"

#include "AddressCache.hpp"
#include "Capabilities.hpp"
#include "DeviceRecord.hpp"
#include "NetworkInfo.hpp"
#include "logging.hpp"

//=============================================================================================
// tolower is only defined for values an unsigned char can hold
//=============================================================================================
static char toLowerAscii(char c)
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

//=============================================================================================
DeviceResolver::DeviceResolver(AddressCache&       cache,
                               ScanCapability&     scanner,
                               ReachabilityProbe&  liveness_probe,
                               ReachabilityProbe&  sweep_probe,
                               IdentityProbe&      identity_probe,
                               HostnameLookup&     hostname_lookup,
                               LocalAddressSource& local_address,
                               const std::string&  device_hostname,
                               EventLog&           log) :
    cache(cache),
    scanner(scanner),
    liveness_probe(liveness_probe),
    sweep_probe(sweep_probe),
    identity_probe(identity_probe),
    hostname_lookup(hostname_lookup),
    local_address(local_address),
    device_hostname(device_hostname),
    log(log)
{
}

//=============================================================================================
DeviceResolver::~DeviceResolver()
{
}

//=============================================================================================
DeviceResolver::Source DeviceResolver::resolve(
    const std::string&                           known_address,
    const std::chrono::system_clock::time_point& now,
    std::string&                                 address)
{
    if (!known_address.empty())
    {
        if (verify(known_address))
        {
            address = known_address;
            return RESOLVED_KNOWN;
        }

        log.info("Known address " + known_address + " failed verification");
    }

    DeviceRecord record;
    if (cache.load(now, record))
    {
        // No point probing the address that just failed a second time
        if (record.address == known_address)
        {
            log.info("Cached address is the one that just failed, will scan network");
        }
        else
        {
            log.info("Trying cached address...");

            if (verify(record.address))
            {
                log.info("Cached address " + record.address + " verified successfully");
                address = record.address;
                return RESOLVED_CACHED;
            }

            log.info("Cached address verification failed, will scan network");
        }
    }

    log.info("No device address - scanning network...");

    std::string discovered;
    if (!scanNetwork(discovered))
    {
        log.warning("Display not found on network");
        return RESOLVED_NONE;
    }

    log.info("Display address found: " + discovered);

    if (!cache.save(discovered, device_hostname, now))
    {
        log.warning("Continuing with uncached address " + discovered);
    }

    address = discovered;
    return RESOLVED_SCANNED;
}

//=============================================================================================
bool DeviceResolver::verify(const std::string& address)
{
    if (!liveness_probe.isReachable(address))
    {
        log.debug("Address " + address + " not responding to ping");
        return false;
    }

    return identity_probe.check(address);
}

//=============================================================================================
bool DeviceResolver::scanNetwork(std::string& address)
{
    std::string own_address;
    if (!local_address.getLocalAddress(own_address))
    {
        log.error("Failed to get local IP");
        return false;
    }

    std::string subnet_prefix;
    if (!networkInfo::subnetPrefix24(own_address, subnet_prefix))
    {
        log.error("Could not determine network range from " + own_address);
        return false;
    }

    std::vector<std::string> scanned;
    if (!scanner.scan(subnet_prefix, scanned))
    {
        log.warning("Scanner not available, trying alternative scan...");
        return sweepNetwork(subnet_prefix, address);
    }

    std::vector<std::string> candidates;
    for (std::vector<std::string>::const_iterator iter = scanned.begin();
         iter != scanned.end();
         ++iter)
    {
        if (networkInfo::isValidHostAddress(*iter))
        {
            candidates.push_back(*iter);
        }
        else
        {
            log.debug("Ignoring scan result \"" + *iter + "\"");
        }
    }

    if (candidates.empty())
    {
        log.warning("No devices with cast ports found");
        return false;
    }

    for (std::vector<std::string>::const_iterator iter = candidates.begin();
         iter != candidates.end();
         ++iter)
    {
        if (identity_probe.check(*iter))
        {
            log.info("Found verified display at " + *iter);
            address = *iter;
            return true;
        }
    }

    // The identity probe is itself unreliable, so a device with the right ports is still the
    // best guess available
    log.info("Found device at " + candidates.front() + " (identity verification failed)");
    address = candidates.front();
    return true;
}

//=============================================================================================
bool DeviceResolver::sweepNetwork(const std::string& subnet_prefix, std::string& address)
{
    log.info("Using ping-based network scan...");

    std::vector<std::string> live_addresses;
    for (unsigned int host = 1; host <= 254; host++)
    {
        std::ostringstream candidate;
        candidate << subnet_prefix << "." << host;

        if (sweep_probe.isReachable(candidate.str()))
        {
            live_addresses.push_back(candidate.str());
        }
    }

    std::ostringstream message;
    message << live_addresses.size() << " host(s) answered the ping sweep";
    log.debug(message.str());

    for (std::vector<std::string>::const_iterator iter = live_addresses.begin();
         iter != live_addresses.end();
         ++iter)
    {
        if (matchesDeviceHostname(*iter))
        {
            log.info("Found display at " + *iter);
            address = *iter;
            return true;
        }
    }

    return false;
}

//=============================================================================================
bool DeviceResolver::matchesDeviceHostname(const std::string& address)
{
    std::string hostname;
    if (!hostname_lookup.lookup(address, hostname))
    {
        return identity_probe.check(address);
    }

    std::string wanted = device_hostname;
    std::transform(hostname.begin(), hostname.end(), hostname.begin(), toLowerAscii);
    std::transform(wanted.begin(), wanted.end(), wanted.begin(), toLowerAscii);

    return hostname.find(wanted) != std::string::npos;
}
