#if !defined NMAP_SCANNER_HPP
#define NMAP_SCANNER_HPP

#include <chrono>
#include <string>
#include <vector>

#include "Capabilities.hpp"

class CommandRunner;
class EventLog;

// Scans a /24 with nmap for Google hosts that have a cast discovery port open
class NmapScanner : public ScanCapability
{
public:

    NmapScanner(CommandRunner& runner, EventLog& log);

    virtual ~NmapScanner();

    virtual bool scan(const std::string& subnet_prefix, std::vector<std::string>& candidates);

    // Extracts hosts from nmap's normal output that report a discovery port open and a Google
    // MAC address, in report order
    static void parseReport(const std::string& report, std::vector<std::string>& candidates);

    static const std::chrono::seconds TIMEOUT;

private:

    CommandRunner& runner;

    EventLog& log;

    NmapScanner(const NmapScanner&);
    NmapScanner& operator=(const NmapScanner&);
};

#endif
