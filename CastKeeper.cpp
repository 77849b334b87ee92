// This program keeps a web page cast to a smart display on the LAN.  It finds the display,
// keeps a local web server up, and recasts whenever the display stops showing the page.

#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

#include "CastKeeper.hpp"

#include "Log.hpp"
#include "SignalManager.hpp"

//=============================================================================================
CastKeeper::CastKeeper(int                             argc,
                       char**                          argv,
                       const std::chrono::nanoseconds& period,
                       const std::chrono::nanoseconds& tolerance) :
    FixedRateProgram(argc, argv, period, tolerance),
    settings(loadSettings()),
    event_log(log, settings.log_level),
    scanner(command_runner, event_log),
    liveness_probe(command_runner, event_log, 2),
    sweep_probe(command_runner, event_log, 1),
    identity_probe(command_runner, event_log),
    status_probe(command_runner, event_log),
    cast_trigger(command_runner, event_log),
    content_endpoint(command_runner,
                     event_log,
                     settings.container_name,
                     settings.container_image),
    endpoint_health(event_log),
    display_health(status_probe, event_log),
    cache(settings.cache_filename, event_log),
    resolver(cache,
             scanner,
             liveness_probe,
             sweep_probe,
             identity_probe,
             hostname_lookup,
             local_address,
             settings.device_hostname,
             event_log),
    supervisor(resolver,
               endpoint_health,
               display_health,
               content_endpoint,
               cast_trigger,
               local_address,
               settings.supervisor,
               event_log),
    next_cycle(std::chrono::steady_clock::now()),
    stopped(false)
{
    // Initialize the output stream to be used for log file writing
    openLog();

    // Write our PID to file
    if (!writePidToFile(settings.pid_filename))
    {
        event_log.warning("Cannot write PID file " + settings.pid_filename);
    }

    // Register signals to handle
    SignalManager* signal_manager = getSignalManager();
    signal_manager->registerSignal(SIGINT);
    signal_manager->registerSignal(SIGTERM);
    signal_manager->registerSignal(SIGUSR1);
    signal_manager->registerSignal(SIGUSR2);

    // Note that the service has started
    event_log.info("Service starting");

    // Nothing useful can happen without somewhere to serve the content from
    if (!content_endpoint.isAvailable())
    {
        event_log.error("Content server runtime is not available, exiting");

        closeLog();
        unlink(settings.pid_filename.c_str());

        throw std::runtime_error("Content server runtime is not available");
    }

    // Clear out anything left behind by a previous run
    content_endpoint.cleanup();
}

//=============================================================================================
CastKeeper::~CastKeeper()
{
    shutdown();
}

//=============================================================================================
// Body of the main loop, executed periodically and indefinitely
//=============================================================================================
void CastKeeper::step()
{
    if (!stopped && std::chrono::steady_clock::now() >= next_cycle)
    {
        std::chrono::seconds wait = supervisor.runCycle(std::chrono::system_clock::now());

        // The wait runs from the end of the cycle, however long the cycle took
        next_cycle = std::chrono::steady_clock::now() + wait;
    }

    // Signals are handled here so that a shutdown never interrupts a cycle in progress
    processDeliveredSignals();
}

//=============================================================================================
// Delivered signals handled here
//=============================================================================================
void CastKeeper::processDeliveredSignals()
{
    SignalManager* signal_manager = getSignalManager();

    if (signal_manager->isSignalDelivered(SIGUSR1))
    {
        // Logrotate uses this
        closeLog();
    }

    if (signal_manager->isSignalDelivered(SIGUSR2))
    {
        // Logrotate uses this
        openLog();
    }

    if (signal_manager->isSignalDelivered(SIGINT) ||
        signal_manager->isSignalDelivered(SIGTERM))
    {
        event_log.info("Received shutdown signal");
        shutdown();
    }
}

//=============================================================================================
Settings CastKeeper::loadSettings()
{
    std::vector<std::string> arguments;
    getArguments(arguments);

    Settings loaded;

    // A missing defaults file just means the built-in defaults apply
    std::string default_filename = Settings::findDefaultFilename(arguments);
    if (!loaded.processDefaultFile(default_filename))
    {
        std::cerr << "No defaults file at " << default_filename << ", using built-in defaults\n";
    }

    // Arguments override the defaults file
    if (!loaded.processArguments(arguments))
    {
        throw std::runtime_error("Cannot process arguments");
    }

    return loaded;
}

//=============================================================================================
// Opens the log file; used after log rotation and during startup
//=============================================================================================
void CastKeeper::openLog()
{
    if (settings.log_filename == "-")
    {
        log.setOutputStream(std::cout);
    }
    else
    {
        log_stream.open(settings.log_filename.c_str(), std::ofstream::app);
        log.setOutputStream(log_stream);
    }

    log.flushAfterWrite(true);
    log.useLocalTime();

    event_log.debug("Log file open");
}

//=============================================================================================
// Closes the log file; used before log rotation and on shutdown
//=============================================================================================
void CastKeeper::closeLog()
{
    event_log.debug("Closing log file");

    if (log_stream.is_open())
    {
        log_stream.close();
    }
}

//=============================================================================================
// Frees resources and triggers program shutdown at the end of the current step
//=============================================================================================
void CastKeeper::shutdown()
{
    if (stopped)
    {
        return;
    }

    stopped = true;

    event_log.info("Cast Keeper shutting down...");

    content_endpoint.cleanup();

    // Log that the service is stopping
    event_log.info("Service stopping");

    closeLog();

    // Delete the PID file
    unlink(settings.pid_filename.c_str());

    // Signal that we should stop running
    setTerminate(true);
}

//=============================================================================================
// Writes the PID of the calling process to file
//=============================================================================================
bool CastKeeper::writePidToFile(const std::string& pid_filename)
{
    std::ofstream out_stream(pid_filename.c_str());
    out_stream << getpid() << "\n";
    out_stream.close();

    return !out_stream.fail();
}
