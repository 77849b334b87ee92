#include <algorithm>
#include <cctype>
#include <chrono>
#include <string>
#include <vector>

#include "Catt.hpp"

#include "CommandRunner.hpp"
#include "logging.hpp"

const std::chrono::seconds CattIdentityProbe::TIMEOUT(15);
const std::chrono::seconds CattStatusProbe::TIMEOUT(10);
const std::chrono::seconds CattCastTrigger::TIMEOUT(30);

// Lowercase substrings that show up in the status of Nest Hubs and Chromecasts
static const char* const IDENTITY_INDICATORS[] =
{
    "nest hub",
    "google nest",
    "living room",
    "display",
    "chromecast",
    "cast",
    "backdrop",
    "idle",
    "ready"
};

//=============================================================================================
// tolower is only defined for values an unsigned char can hold
//=============================================================================================
static char toLowerAscii(char c)
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

//=============================================================================================
static std::string trimWhitespace(const std::string& text)
{
    std::string::size_type first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
    {
        return "";
    }

    std::string::size_type last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

//=============================================================================================
static std::vector<std::string> cattArguments(const std::string& address,
                                              const std::string& command)
{
    std::vector<std::string> arguments;
    arguments.push_back("catt");
    arguments.push_back("-d");
    arguments.push_back(address);
    arguments.push_back(command);

    return arguments;
}

//=============================================================================================
CattIdentityProbe::CattIdentityProbe(CommandRunner& runner, EventLog& log) :
    runner(runner),
    log(log)
{
}

//=============================================================================================
CattIdentityProbe::~CattIdentityProbe()
{
}

//=============================================================================================
bool CattIdentityProbe::check(const std::string& address)
{
    CommandResult result;
    if (!runner.run(cattArguments(address, "status"), TIMEOUT, result))
    {
        if (result.timed_out)
        {
            log.debug("Cast device check timed out for " + address);
        }
        else
        {
            log.debug("Cast device check failed for " + address + ": " +
                      trimWhitespace(result.error_output));
        }

        return false;
    }

    if (!matchesIndicators(result.output))
    {
        log.debug("No cast device indicators in status of " + address);
        return false;
    }

    log.info("Found cast device at " + address + ": " + trimWhitespace(result.output));
    return true;
}

//=============================================================================================
bool CattIdentityProbe::matchesIndicators(const std::string& status)
{
    std::string lowered = status;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), toLowerAscii);

    const unsigned int indicator_count =
        sizeof(IDENTITY_INDICATORS) / sizeof(IDENTITY_INDICATORS[0]);

    for (unsigned int i = 0; i < indicator_count; i++)
    {
        if (lowered.find(IDENTITY_INDICATORS[i]) != std::string::npos)
        {
            return true;
        }
    }

    return false;
}

//=============================================================================================
CattStatusProbe::CattStatusProbe(CommandRunner& runner, EventLog& log) :
    runner(runner),
    log(log)
{
}

//=============================================================================================
CattStatusProbe::~CattStatusProbe()
{
}

//=============================================================================================
bool CattStatusProbe::snapshot(const std::string& address, std::string& status)
{
    CommandResult result;
    if (!runner.run(cattArguments(address, "info"), TIMEOUT, result))
    {
        if (result.timed_out)
        {
            log.warning("Device info check timed out");
        }
        else
        {
            log.warning("Failed to get device info: " + trimWhitespace(result.error_output));
        }

        return false;
    }

    status = trimWhitespace(result.output);
    log.debug("Device info: " + status);

    return true;
}

//=============================================================================================
CattCastTrigger::CattCastTrigger(CommandRunner& runner, EventLog& log) :
    runner(runner),
    log(log)
{
}

//=============================================================================================
CattCastTrigger::~CattCastTrigger()
{
}

//=============================================================================================
bool CattCastTrigger::cast(const std::string& address, const std::string& url)
{
    std::vector<std::string> arguments = cattArguments(address, "cast_site");
    arguments.push_back(url);

    log.info("Casting " + url + " to " + address + "...");

    CommandResult result;
    if (!runner.run(arguments, TIMEOUT, result))
    {
        if (result.timed_out)
        {
            log.error("Casting command timed out");
        }
        else
        {
            log.error("Casting failed: " + trimWhitespace(result.error_output));
        }

        return false;
    }

    log.info("Cast initiated: " + trimWhitespace(result.output));
    return true;
}
