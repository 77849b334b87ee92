#if !defined CATT_HPP
#define CATT_HPP

#include <chrono>
#include <string>

#include "Capabilities.hpp"

class CommandRunner;
class EventLog;

// Adapters over the catt ("Cast All The Things") command line utility

// "catt -d <address> status", accepted if the output mentions any known cast device indicator
class CattIdentityProbe : public IdentityProbe
{
public:

    CattIdentityProbe(CommandRunner& runner, EventLog& log);

    virtual ~CattIdentityProbe();

    virtual bool check(const std::string& address);

    // Case-insensitive search for any of the identity indicators
    static bool matchesIndicators(const std::string& status);

    static const std::chrono::seconds TIMEOUT;

private:

    CommandRunner& runner;

    EventLog& log;

    CattIdentityProbe(const CattIdentityProbe&);
    CattIdentityProbe& operator=(const CattIdentityProbe&);
};

// "catt -d <address> info"
class CattStatusProbe : public StatusProbe
{
public:

    CattStatusProbe(CommandRunner& runner, EventLog& log);

    virtual ~CattStatusProbe();

    virtual bool snapshot(const std::string& address, std::string& status);

    static const std::chrono::seconds TIMEOUT;

private:

    CommandRunner& runner;

    EventLog& log;

    CattStatusProbe(const CattStatusProbe&);
    CattStatusProbe& operator=(const CattStatusProbe&);
};

// "catt -d <address> cast_site <url>"
class CattCastTrigger : public CastTrigger
{
public:

    CattCastTrigger(CommandRunner& runner, EventLog& log);

    virtual ~CattCastTrigger();

    virtual bool cast(const std::string& address, const std::string& url);

    static const std::chrono::seconds TIMEOUT;

private:

    CommandRunner& runner;

    EventLog& log;

    CattCastTrigger(const CattCastTrigger&);
    CattCastTrigger& operator=(const CattCastTrigger&);
};

#endif
