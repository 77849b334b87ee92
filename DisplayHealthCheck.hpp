#if !defined DISPLAY_HEALTH_CHECK_HPP
#define DISPLAY_HEALTH_CHECK_HPP

#include <string>

class EventLog;
class StatusProbe;

// Judges from one status snapshot whether the display is showing web content.  An active
// DashCast receiver is taken to mean our content; other senders' web pages are
// indistinguishable from ours.
class DisplayHealthCheck
{
public:

    DisplayHealthCheck(StatusProbe& status_probe, EventLog& log);

    ~DisplayHealthCheck();

    bool isDisplayShowingContent(const std::string& device_address);

    // Case-insensitive match against the DashCast display name, its application ID, or the
    // "Application ready" status text
    static bool showsContent(const std::string& status);

private:

    StatusProbe& status_probe;

    EventLog& log;

    DisplayHealthCheck(const DisplayHealthCheck&);
    DisplayHealthCheck& operator=(const DisplayHealthCheck&);
};

#endif
