#include <chrono>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "Settings.hpp"

const char* const Settings::DEFAULT_FILENAME = "/etc/castkeeper/config";

// Longest accepted period; anything above one day is taken as a typo
static const long MAXIMUM_PERIOD_SECONDS = 86400;

//=============================================================================================
// Reads a whole number in [minimum, maximum]; unsigned extraction would wrap a leading minus
// sign, so the value is read signed
//=============================================================================================
static bool parseBoundedNumber(const std::string& text,
                               long               minimum,
                               long               maximum,
                               long&              number)
{
    std::istringstream convert_to_number(text);

    long value = 0;
    convert_to_number >> value;

    if (convert_to_number.fail() || !convert_to_number.eof() ||
        value < minimum || value > maximum)
    {
        return false;
    }

    number = value;
    return true;
}

//=============================================================================================
// Reads a whole number of seconds; leaves period alone if the text isn't one in range
//=============================================================================================
static void parseSeconds(const std::string& text, std::chrono::seconds& period)
{
    long seconds = 0;
    if (parseBoundedNumber(text, 1, MAXIMUM_PERIOD_SECONDS, seconds))
    {
        period = std::chrono::seconds(seconds);
    }
}

//=============================================================================================
Settings::Settings() :
    default_filename(DEFAULT_FILENAME),
    log_filename("/var/log/castkeeper.log"),
    log_level(EventLog::LEVEL_DEBUG),
    pid_filename("/var/run/castkeeper.pid"),
    cache_filename("/var/lib/castkeeper/device_cache.json"),
    device_hostname("nest-hub"),
    container_name("castkeeper-server"),
    container_image("httpd:alpine")
{
}

//=============================================================================================
bool Settings::processDefaultFile(const std::string& filename)
{
    std::ifstream default_stream(filename.c_str());
    if (default_stream.fail())
    {
        return false;
    }

    std::string default_line;
    while (std::getline(default_stream, default_line))
    {
        // Tolerate files written on Windows
        if (!default_line.empty() && default_line[default_line.size() - 1] == '\r')
        {
            default_line.erase(default_line.size() - 1);
        }

        // Ignore the line if it's empty or a comment
        if (default_line.empty() || default_line[0] == '#')
        {
            continue;
        }

        // If there isn't an equal sign, or the equal sign is at the beginning or end of the
        // line, this line is bad
        std::string::size_type equal_sign = default_line.find('=');
        if (equal_sign == std::string::npos ||
            equal_sign == 0 ||
            equal_sign == default_line.length() - 1)
        {
            continue;
        }

        std::string left_side  = default_line.substr(0, equal_sign);
        std::string right_side = default_line.substr(equal_sign + 1);

        if (left_side == "LOG_FILE")
        {
            log_filename = right_side;
        }
        else if (left_side == "LOG_LEVEL")
        {
            EventLog::Level level = log_level;
            if (EventLog::parseLevel(right_side, level))
            {
                log_level = level;
            }
        }
        else if (left_side == "PID_FILE")
        {
            pid_filename = right_side;
        }
        else if (left_side == "CACHE_FILE")
        {
            cache_filename = right_side;
        }
        else if (left_side == "DEVICE_HOSTNAME")
        {
            device_hostname = right_side;
        }
        else if (left_side == "SERVER_PORT")
        {
            long port = 0;
            if (parseBoundedNumber(right_side, 1, 65535, port))
            {
                supervisor.server_port = static_cast<unsigned short>(port);
            }
        }
        else if (left_side == "CONTENT_DIR")
        {
            supervisor.content_dir = right_side;
        }
        else if (left_side == "CONTAINER_NAME")
        {
            container_name = right_side;
        }
        else if (left_side == "CONTAINER_IMAGE")
        {
            container_image = right_side;
        }
        else if (left_side == "CYCLE_PERIOD")
        {
            parseSeconds(right_side, supervisor.cycle_period);
            supervisor.retry_period = supervisor.cycle_period;
        }
        else if (left_side == "VERIFY_PERIOD")
        {
            parseSeconds(right_side, supervisor.reverify_period);
        }
    }

    return true;
}

//=============================================================================================
bool Settings::processArguments(const std::vector<std::string>& arguments)
{
    std::vector<std::string>::const_iterator current_argument = arguments.begin();

    while (current_argument != arguments.end())
    {
        // Convenience reference to the next argument
        std::vector<std::string>::const_iterator next_argument = current_argument + 1;

        bool takes_value = *current_argument == "-d" ||
                           *current_argument == "-c" ||
                           *current_argument == "-l" ||
                           *current_argument == "--pidfile";

        if (takes_value)
        {
            if (next_argument == arguments.end())
            {
                return false;
            }

            // Argument -d specifies the defaults file filename
            if (*current_argument == "-d")
            {
                default_filename = *next_argument;
            }
            // Argument -c specifies the cache file filename
            else if (*current_argument == "-c")
            {
                cache_filename = *next_argument;
            }
            // Argument -l specifies the log file filename
            else if (*current_argument == "-l")
            {
                log_filename = *next_argument;
            }
            // Argument --pidfile specifies the file in which the PID is stored
            else
            {
                pid_filename = *next_argument;
            }

            // Skip over the value so it isn't mistaken for a switch
            ++current_argument;
        }

        ++current_argument;
    }

    return true;
}

//=============================================================================================
std::string Settings::findDefaultFilename(const std::vector<std::string>& arguments)
{
    for (unsigned int i = 0; i + 1 < arguments.size(); i++)
    {
        if (arguments[i] == "-d")
        {
            return arguments[i + 1];
        }
    }

    return DEFAULT_FILENAME;
}
