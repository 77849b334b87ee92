#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>

#include "Supervisor.hpp"

#include "Capabilities.hpp"
#include "DeviceResolver.hpp"
#include "DisplayHealthCheck.hpp"
#include "EndpointHealthCheck.hpp"
#include "logging.hpp"

//=============================================================================================
SupervisorSettings::SupervisorSettings() :
    server_port(5500),
    content_dir("/opt/castkeeper/src"),
    cycle_period(30),
    retry_period(30),
    reverify_period(600),
    lost_address_delay(1)
{
}

//=============================================================================================
SupervisorState::SupervisorState() :
    has_cast(false)
{
}

//=============================================================================================
Supervisor::Supervisor(DeviceResolver&           resolver,
                       EndpointHealthCheck&      endpoint_health,
                       DisplayHealthCheck&       display_health,
                       ContentEndpoint&          content_endpoint,
                       CastTrigger&              cast_trigger,
                       LocalAddressSource&       local_address,
                       const SupervisorSettings& settings,
                       EventLog&                 log) :
    resolver(resolver),
    endpoint_health(endpoint_health),
    display_health(display_health),
    content_endpoint(content_endpoint),
    cast_trigger(cast_trigger),
    local_address(local_address),
    settings(settings),
    log(log)
{
}

//=============================================================================================
Supervisor::~Supervisor()
{
}

//=============================================================================================
// A failure in one cycle must never take the supervisor down
//=============================================================================================
std::chrono::seconds Supervisor::runCycle(const std::chrono::system_clock::time_point& now)
{
    try
    {
        return cycle(now);
    }
    catch (std::exception& ex)
    {
        log.error(std::string("Unexpected error in supervision cycle: ") + ex.what());
    }

    return settings.retry_period;
}

//=============================================================================================
const SupervisorState& Supervisor::getState() const
{
    return state;
}

//=============================================================================================
std::chrono::seconds Supervisor::cycle(const std::chrono::system_clock::time_point& now)
{
    // An address found by the resolver has just been checked; one carried over from an
    // earlier cycle has not
    bool verified_this_cycle = false;

    if (state.known_address.empty())
    {
        std::string address;
        if (resolver.resolve("", now, address) == DeviceResolver::RESOLVED_NONE)
        {
            return settings.retry_period;
        }

        state.known_address    = address;
        state.last_verified_at = now;
        verified_this_cycle    = true;
    }

    HealthSnapshot health = checkHealth();

    if (!verified_this_cycle)
    {
        bool reverification_due = isReverificationDue(now);

        if (health.endpoint_healthy && health.display_showing_content && !reverification_due)
        {
            log.debug("All systems healthy - no action needed");
            return settings.cycle_period;
        }

        if (!health.endpoint_healthy)
        {
            log.info("Web server issue detected");
        }

        if (!health.display_showing_content)
        {
            log.info("Cast status issue detected");
        }

        if (reverification_due)
        {
            log.debug("Periodic address verification...");
        }

        // Nothing gets started or cast toward an address that no longer checks out
        if (!resolver.verify(state.known_address))
        {
            log.info("Address verification failed - device may have changed");
            state.known_address.clear();
            return settings.lost_address_delay;
        }

        state.last_verified_at = now;
    }

    if (!content_endpoint.ensureRunning(settings.server_port, settings.content_dir))
    {
        log.error("Failed to start web server");
        return settings.retry_period;
    }

    if (state.has_cast && health.display_showing_content)
    {
        return settings.cycle_period;
    }

    if (!state.has_cast)
    {
        log.info("Performing initial cast...");
    }
    else
    {
        log.info("Recasting due to status issue...");
    }

    if (!castContent(now))
    {
        log.error("Failed to cast, will retry next cycle");
    }

    return settings.cycle_period;
}

//=============================================================================================
HealthSnapshot Supervisor::checkHealth()
{
    HealthSnapshot health;

    std::string self_address;
    if (local_address.getLocalAddress(self_address))
    {
        health.endpoint_healthy =
            endpoint_health.isEndpointHealthy(self_address, settings.server_port);
    }
    else
    {
        log.warning("Cannot determine local IP for web server health check");
        health.endpoint_healthy = false;
    }

    health.display_showing_content =
        display_health.isDisplayShowingContent(state.known_address);

    return health;
}

//=============================================================================================
bool Supervisor::isReverificationDue(const std::chrono::system_clock::time_point& now) const
{
    return now - state.last_verified_at >= settings.reverify_period;
}

//=============================================================================================
// Records the cast time only when the trigger reports success; whether the display actually
// shows the content is left to the next cycle's health check
//=============================================================================================
bool Supervisor::castContent(const std::chrono::system_clock::time_point& now)
{
    std::string self_address;
    if (!local_address.getLocalAddress(self_address))
    {
        log.error("Cannot determine local IP for casting");
        return false;
    }

    std::ostringstream url;
    url << "http://";
    if (self_address.find(':') != std::string::npos)
    {
        url << "[" << self_address << "]";
    }
    else
    {
        url << self_address;
    }
    url << ":" << settings.server_port << "/";

    if (!cast_trigger.cast(state.known_address, url.str()))
    {
        return false;
    }

    state.has_cast     = true;
    state.last_cast_at = now;

    return true;
}
