#include <algorithm>
#include <cctype>
#include <string>

#include "DisplayHealthCheck.hpp"

#include "Capabilities.hpp"
#include "logging.hpp"

//=============================================================================================
static char toLowerAscii(char c)
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

//=============================================================================================
DisplayHealthCheck::DisplayHealthCheck(StatusProbe& status_probe, EventLog& log) :
    status_probe(status_probe),
    log(log)
{
}

//=============================================================================================
DisplayHealthCheck::~DisplayHealthCheck()
{
}

//=============================================================================================
bool DisplayHealthCheck::isDisplayShowingContent(const std::string& device_address)
{
    std::string status;
    if (!status_probe.snapshot(device_address, status))
    {
        return false;
    }

    if (!showsContent(status))
    {
        log.debug("No DashCast app detected or device idle");
        return false;
    }

    log.debug("DashCast app is active - assuming our content is displayed");
    return true;
}

//=============================================================================================
bool DisplayHealthCheck::showsContent(const std::string& status)
{
    std::string lowered = status;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), toLowerAscii);

    // 84912283 is DashCast's receiver application ID
    return lowered.find("display_name: dashcast")         != std::string::npos ||
           lowered.find("app_id: 84912283")               != std::string::npos ||
           lowered.find("status_text: application ready") != std::string::npos;
}
