#if !defined CAST_KEEPER_HPP
#define CAST_KEEPER_HPP

#include <chrono>
#include <fstream>
#include <string>

#include "FixedRateProgram.hpp"

#include "AddressCache.hpp"
#include "Catt.hpp"
#include "CommandRunner.hpp"
#include "DeviceResolver.hpp"
#include "DisplayHealthCheck.hpp"
#include "DockerContentEndpoint.hpp"
#include "EndpointHealthCheck.hpp"
#include "Log.hpp"
#include "NetworkInfo.hpp"
#include "NmapScanner.hpp"
#include "PingProbe.hpp"
#include "Settings.hpp"
#include "Supervisor.hpp"
#include "logging.hpp"

class CastKeeper : public FixedRateProgram
{
public:

    // Throws std::runtime_error if the arguments are bad or the content server runtime is
    // unavailable
    CastKeeper(int                             argc,
               char**                          argv,
               const std::chrono::nanoseconds& period,
               const std::chrono::nanoseconds& tolerance =
               std::chrono::nanoseconds(static_cast<unsigned int>(1e8)));

    virtual ~CastKeeper();

    // Body of the main loop; runs a supervision cycle whenever the previous one's wait is over
    virtual void step();

protected:

    // Delivered signals handled here
    virtual void processDeliveredSignals();

private:

    // Builds the settings from the defaults file and program arguments
    Settings loadSettings();

    // Opens the log file; used after log rotation and during startup
    void openLog();

    // Closes the log file; used before log rotation and on shutdown
    void closeLog();

    // Frees resources and triggers program shutdown at the end of the current step
    void shutdown();

    static bool writePidToFile(const std::string& pid_filename);

    Settings settings;

    // Used to log important castkeeper activities
    Log log;

    // Log messages go out on this stream, unless they go to standard output
    std::ofstream log_stream;

    EventLog event_log;

    PosixCommandRunner command_runner;

    RoutingLocalAddress local_address;

    ReverseDnsLookup hostname_lookup;

    NmapScanner scanner;

    // Two-second wait for verifying single addresses, one second for sweeping the subnet
    PingProbe liveness_probe;
    PingProbe sweep_probe;

    CattIdentityProbe identity_probe;

    CattStatusProbe status_probe;

    CattCastTrigger cast_trigger;

    DockerContentEndpoint content_endpoint;

    HttpEndpointHealthCheck endpoint_health;

    DisplayHealthCheck display_health;

    AddressCache cache;

    DeviceResolver resolver;

    Supervisor supervisor;

    // When the next supervision cycle is due
    std::chrono::steady_clock::time_point next_cycle;

    // True once shutdown() has run
    bool stopped;

    CastKeeper(const CastKeeper&);
    CastKeeper& operator=(const CastKeeper&);
};

#endif
