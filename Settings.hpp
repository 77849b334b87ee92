#if !defined SETTINGS_HPP
#define SETTINGS_HPP

#include <string>
#include <vector>

#include "Supervisor.hpp"
#include "logging.hpp"

// Program configuration, from built-in defaults, then the defaults file, then the command line
struct Settings
{
    Settings();

    // Reads KEY=VALUE lines; '#' starts a comment line and unrecognized lines are skipped.
    // Returns false only if the file cannot be opened.
    bool processDefaultFile(const std::string& filename);

    // Applies command line switches.  Returns false if a switch is missing its value.
    bool processArguments(const std::vector<std::string>& arguments);

    // Value of the -d switch, or the built-in defaults file location
    static std::string findDefaultFilename(const std::vector<std::string>& arguments);

    // Filename of the defaults file, typically located in /etc/castkeeper
    std::string default_filename;

    // Filename of the log file, typically located in /var/log; "-" logs to standard output
    std::string log_filename;

    EventLog::Level log_level;

    // Filename of the file in which PID is stored
    std::string pid_filename;

    // Where the display's last known address is kept
    std::string cache_filename;

    // Name the display is expected to go by on the network
    std::string device_hostname;

    std::string container_name;

    std::string container_image;

    SupervisorSettings supervisor;

    static const char* const DEFAULT_FILENAME;
};

#endif
