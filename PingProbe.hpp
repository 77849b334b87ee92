#if !defined PING_PROBE_HPP
#define PING_PROBE_HPP

#include <string>

#include "Capabilities.hpp"

class CommandRunner;
class EventLog;

// Single ICMP echo through the system ping utility
class PingProbe : public ReachabilityProbe
{
public:

    // wait_seconds is ping's own reply timeout; the process is killed a few seconds after
    PingProbe(CommandRunner& runner, EventLog& log, unsigned int wait_seconds);

    virtual ~PingProbe();

    virtual bool isReachable(const std::string& address);

private:

    CommandRunner& runner;

    EventLog& log;

    unsigned int wait_seconds;

    PingProbe(const PingProbe&);
    PingProbe& operator=(const PingProbe&);
};

#endif
