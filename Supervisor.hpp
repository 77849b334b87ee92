#if !defined SUPERVISOR_HPP
#define SUPERVISOR_HPP

#include <chrono>
#include <string>

class CastTrigger;
class ContentEndpoint;
class DeviceResolver;
class DisplayHealthCheck;
class EndpointHealthCheck;
class EventLog;
class LocalAddressSource;

struct SupervisorSettings
{
    SupervisorSettings();

    // Port the content server listens on
    unsigned short server_port;

    // Directory the content server serves
    std::string content_dir;

    // Wait after a cycle that ended normally
    std::chrono::seconds cycle_period;

    // Wait after a cycle that could not find the display or start the server
    std::chrono::seconds retry_period;

    // Maximum time a healthy display goes without its address being re-verified
    std::chrono::seconds reverify_period;

    // Wait after the known address failed re-verification, before rescanning
    std::chrono::seconds lost_address_delay;
};

// Everything the supervisor remembers between cycles
struct SupervisorState
{
    SupervisorState();

    // Empty when the display's address is unknown
    std::string known_address;

    std::chrono::system_clock::time_point last_verified_at;

    // Whether a cast has ever succeeded, and when the latest one did
    bool has_cast;
    std::chrono::system_clock::time_point last_cast_at;
};

// Health signals gathered at the start of each cycle
struct HealthSnapshot
{
    bool endpoint_healthy;
    bool display_showing_content;
};

// Keeps the content server up and cast to the display.  Each cycle either finds the display,
// confirms that everything is healthy, or re-verifies the display's address and then repairs
// whatever is broken.
class Supervisor
{
public:

    Supervisor(DeviceResolver&           resolver,
               EndpointHealthCheck&      endpoint_health,
               DisplayHealthCheck&       display_health,
               ContentEndpoint&          content_endpoint,
               CastTrigger&              cast_trigger,
               LocalAddressSource&       local_address,
               const SupervisorSettings& settings,
               EventLog&                 log);

    ~Supervisor();

    // Runs a single cycle and returns how long to wait before the next one.  Never throws.
    std::chrono::seconds runCycle(const std::chrono::system_clock::time_point& now);

    const SupervisorState& getState() const;

private:

    std::chrono::seconds cycle(const std::chrono::system_clock::time_point& now);

    HealthSnapshot checkHealth();

    bool isReverificationDue(const std::chrono::system_clock::time_point& now) const;

    bool castContent(const std::chrono::system_clock::time_point& now);

    DeviceResolver& resolver;

    EndpointHealthCheck& endpoint_health;

    DisplayHealthCheck& display_health;

    ContentEndpoint& content_endpoint;

    CastTrigger& cast_trigger;

    LocalAddressSource& local_address;

    SupervisorSettings settings;

    EventLog& log;

    SupervisorState state;

    Supervisor(const Supervisor&);
    Supervisor& operator=(const Supervisor&);
};

#endif
