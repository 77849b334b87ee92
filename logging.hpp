// Levelled logging for castkeeper, layered over the toolbox Log

#if !defined LOGGING_HPP
#define LOGGING_HPP

#include <string>

class Log;

class EventLog
{
public:

    enum Level
    {
        LEVEL_DEBUG,
        LEVEL_INFO,
        LEVEL_WARNING,
        LEVEL_ERROR
    };

    explicit EventLog(Log& log, Level threshold = LEVEL_DEBUG);

    void setThreshold(Level threshold);
    Level getThreshold() const;

    // Messages below the threshold are dropped
    void write(Level level, const std::string& message);

    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // Accepts "debug", "info", "warning" and "error", case-insensitively
    static bool parseLevel(const std::string& name, Level& level);

    static const char* levelName(Level level);

private:

    Log& log;

    Level threshold;

    EventLog(const EventLog&);
    EventLog& operator=(const EventLog&);
};

#endif
