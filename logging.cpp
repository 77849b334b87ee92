// Levelled logging for castkeeper, layered over the toolbox Log

#include <algorithm>
#include <cctype>
#include <string>

#include "logging.hpp"

#include "Log.hpp"

//=============================================================================================
static char toLowerAscii(char c)
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

//=============================================================================================
EventLog::EventLog(Log& log, Level threshold) :
    log(log),
    threshold(threshold)
{
}

//=============================================================================================
void EventLog::setThreshold(Level threshold)
{
    this->threshold = threshold;
}

//=============================================================================================
EventLog::Level EventLog::getThreshold() const
{
    return threshold;
}

//=============================================================================================
// Prepends the level to the message and hands it to the underlying log, which timestamps it
//=============================================================================================
void EventLog::write(Level level, const std::string& message)
{
    if (level < threshold)
    {
        return;
    }

    log.write(std::string(levelName(level)) + " - " + message);
}

//=============================================================================================
void EventLog::debug(const std::string& message)
{
    write(LEVEL_DEBUG, message);
}

//=============================================================================================
void EventLog::info(const std::string& message)
{
    write(LEVEL_INFO, message);
}

//=============================================================================================
void EventLog::warning(const std::string& message)
{
    write(LEVEL_WARNING, message);
}

//=============================================================================================
void EventLog::error(const std::string& message)
{
    write(LEVEL_ERROR, message);
}

//=============================================================================================
bool EventLog::parseLevel(const std::string& name, Level& level)
{
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), toLowerAscii);

    if (lowered == "debug")
    {
        level = LEVEL_DEBUG;
    }
    else if (lowered == "info")
    {
        level = LEVEL_INFO;
    }
    else if (lowered == "warning" || lowered == "warn")
    {
        level = LEVEL_WARNING;
    }
    else if (lowered == "error")
    {
        level = LEVEL_ERROR;
    }
    else
    {
        return false;
    }

    return true;
}

//=============================================================================================
const char* EventLog::levelName(Level level)
{
    switch (level)
    {
    case LEVEL_DEBUG:
        return "DEBUG";
    case LEVEL_INFO:
        return "INFO";
    case LEVEL_WARNING:
        return "WARNING";
    case LEVEL_ERROR:
        return "ERROR";
    }

    return "???";
}
