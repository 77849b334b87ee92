// Scriptable stand-ins for the external world, shared by the test programs

#if !defined FAKE_CAPABILITIES_HPP
#define FAKE_CAPABILITIES_HPP

#include <chrono>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "Capabilities.hpp"
#include "CommandRunner.hpp"
#include "EndpointHealthCheck.hpp"
#include "Log.hpp"
#include "logging.hpp"

// Collects log output in memory so tests can look at it
struct TestLog
{
    TestLog() :
        event_log(log)
    {
        log.setOutputStream(stream);
    }

    bool contains(const std::string& text) const
    {
        return stream.str().find(text) != std::string::npos;
    }

    std::ostringstream stream;

    Log log;

    EventLog event_log;
};

class FakeScanner : public ScanCapability
{
public:

    FakeScanner() : available(true), calls(0) {}

    virtual bool scan(const std::string&        subnet_prefix,
                      std::vector<std::string>& found)
    {
        calls++;
        last_prefix = subnet_prefix;

        found.clear();
        if (!available)
        {
            return false;
        }

        found = candidates;
        return true;
    }

    bool available;
    std::vector<std::string> candidates;
    unsigned int calls;
    std::string last_prefix;
};

class FakeReachabilityProbe : public ReachabilityProbe
{
public:

    FakeReachabilityProbe() : calls(0) {}

    virtual bool isReachable(const std::string& address)
    {
        calls++;
        return reachable.count(address) != 0;
    }

    std::set<std::string> reachable;
    unsigned int calls;
};

class FakeIdentityProbe : public IdentityProbe
{
public:

    FakeIdentityProbe() : calls(0) {}

    virtual bool check(const std::string& address)
    {
        calls++;
        checked.push_back(address);
        return identified.count(address) != 0;
    }

    std::set<std::string> identified;
    std::vector<std::string> checked;
    unsigned int calls;
};

class FakeHostnameLookup : public HostnameLookup
{
public:

    virtual bool lookup(const std::string& address, std::string& hostname)
    {
        std::map<std::string, std::string>::const_iterator i = names.find(address);
        if (i == names.end())
        {
            return false;
        }

        hostname = i->second;
        return true;
    }

    std::map<std::string, std::string> names;
};

class FakeStatusProbe : public StatusProbe
{
public:

    FakeStatusProbe() : succeeds(true), calls(0) {}

    virtual bool snapshot(const std::string&, std::string& text)
    {
        calls++;

        if (!succeeds)
        {
            return false;
        }

        text = status;
        return true;
    }

    bool succeeds;
    std::string status;
    unsigned int calls;
};

class FakeCastTrigger : public CastTrigger
{
public:

    FakeCastTrigger() : succeeds(true), calls(0) {}

    virtual bool cast(const std::string& address, const std::string& url)
    {
        calls++;
        last_address = address;
        last_url = url;
        return succeeds;
    }

    bool succeeds;
    unsigned int calls;
    std::string last_address;
    std::string last_url;
};

class FakeContentEndpoint : public ContentEndpoint
{
public:

    FakeContentEndpoint() :
        available(true),
        starts(true),
        ensure_calls(0),
        cleanup_calls(0),
        last_port(0)
    {
    }

    virtual bool isAvailable()
    {
        return available;
    }

    virtual bool ensureRunning(unsigned short listen_port, const std::string& content_dir)
    {
        ensure_calls++;
        last_port = listen_port;
        last_content_dir = content_dir;
        return starts;
    }

    virtual void cleanup()
    {
        cleanup_calls++;
    }

    bool available;
    bool starts;
    unsigned int ensure_calls;
    unsigned int cleanup_calls;
    unsigned short last_port;
    std::string last_content_dir;
};

class FakeLocalAddress : public LocalAddressSource
{
public:

    FakeLocalAddress() : address("192.168.1.10") {}

    virtual bool getLocalAddress(std::string& local)
    {
        if (address.empty())
        {
            return false;
        }

        local = address;
        return true;
    }

    // Empty means the local address can't be determined
    std::string address;
};

class FakeEndpointHealthCheck : public EndpointHealthCheck
{
public:

    FakeEndpointHealthCheck() : healthy(true), throws(false), calls(0) {}

    virtual bool isEndpointHealthy(const std::string&, unsigned short)
    {
        calls++;

        if (throws)
        {
            throw std::runtime_error("health check exploded");
        }

        return healthy;
    }

    bool healthy;

    // Lets tests check that a failing cycle doesn't escape the supervisor
    bool throws;

    unsigned int calls;
};

// Answers commands from a table keyed by the first two arguments, e.g. "docker ps".  Commands
// not in the table succeed with no output.
class ScriptedCommandRunner : public CommandRunner
{
public:

    virtual bool run(const std::vector<std::string>& arguments,
                     const std::chrono::milliseconds&,
                     CommandResult&                   result)
    {
        commands.push_back(describe(arguments));

        result = CommandResult();
        result.started = true;
        result.exit_status = 0;

        std::map<std::string, CommandResult>::const_iterator i = responses.find(key(arguments));
        if (i != responses.end())
        {
            result = i->second;
        }

        return result.started && !result.timed_out && result.exit_status == 0;
    }

    void respond(const std::string& command_key, int exit_status, const std::string& output)
    {
        CommandResult response;
        response.started = true;
        response.exit_status = exit_status;
        response.output = output;
        responses[command_key] = response;
    }

    void refuse(const std::string& command_key)
    {
        responses[command_key] = CommandResult();
    }

    // Number of recorded commands starting with prefix
    unsigned int count(const std::string& prefix) const
    {
        unsigned int matches = 0;
        for (unsigned int i = 0; i < commands.size(); i++)
        {
            if (commands[i].compare(0, prefix.size(), prefix) == 0)
            {
                matches++;
            }
        }

        return matches;
    }

    std::vector<std::string> commands;

    std::map<std::string, CommandResult> responses;

private:

    static std::string key(const std::vector<std::string>& arguments)
    {
        if (arguments.size() < 2)
        {
            return arguments.empty() ? std::string() : arguments[0];
        }

        return arguments[0] + " " + arguments[1];
    }
};

#endif
