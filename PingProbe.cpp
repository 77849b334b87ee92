#include <chrono>
#include <string>
#include <vector>

#include "PingProbe.hpp"

#include "CommandRunner.hpp"
#include "logging.hpp"

//=============================================================================================
PingProbe::PingProbe(CommandRunner& runner, EventLog& log, unsigned int wait_seconds) :
    runner(runner),
    log(log),
    wait_seconds(wait_seconds)
{
}

//=============================================================================================
PingProbe::~PingProbe()
{
}

//=============================================================================================
bool PingProbe::isReachable(const std::string& address)
{
    std::vector<std::string> arguments;
    arguments.push_back("ping");
    arguments.push_back("-c");
    arguments.push_back("1");
    arguments.push_back("-W");
    arguments.push_back(std::to_string(wait_seconds));
    arguments.push_back(address);

    CommandResult result;
    if (!runner.run(arguments, std::chrono::seconds(wait_seconds + 3), result))
    {
        if (!result.started)
        {
            log.warning("Cannot run ping: " + result.error_output);
        }

        return false;
    }

    return true;
}
