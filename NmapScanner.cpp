#include <chrono>
#include <sstream>
#include <string>
#include <vector>

#include "NmapScanner.hpp"

#include "CommandRunner.hpp"
#include "logging.hpp"

const std::chrono::seconds NmapScanner::TIMEOUT(60);

//=============================================================================================
NmapScanner::NmapScanner(CommandRunner& runner, EventLog& log) :
    runner(runner),
    log(log)
{
}

//=============================================================================================
NmapScanner::~NmapScanner()
{
}

//=============================================================================================
bool NmapScanner::scan(const std::string& subnet_prefix, std::vector<std::string>& candidates)
{
    candidates.clear();

    std::vector<std::string> arguments;
    arguments.push_back("nmap");
    arguments.push_back("-Pn");
    arguments.push_back("-p");
    arguments.push_back("8008,8009");
    arguments.push_back("--open");
    arguments.push_back(subnet_prefix + ".1-254");

    log.debug("Running " + CommandRunner::describe(arguments));

    CommandResult result;
    if (!runner.run(arguments, TIMEOUT, result))
    {
        if (!result.started)
        {
            log.warning("nmap not available: " + result.error_output);
            return false;
        }

        if (result.timed_out)
        {
            log.warning("Network scan timed out");
            return true;
        }

        log.warning("nmap failed with status " + std::to_string(result.exit_status));
        return false;
    }

    parseReport(result.output, candidates);

    std::ostringstream message;
    message << "Found " << candidates.size() << " Google device(s) with cast ports";
    for (unsigned int i = 0; i < candidates.size(); i++)
    {
        message << (i == 0 ? ": " : ", ") << candidates[i];
    }
    log.info(message.str());

    return true;
}

//=============================================================================================
void NmapScanner::parseReport(const std::string& report, std::vector<std::string>& candidates)
{
    std::istringstream report_stream(report);
    std::string line;

    std::string current_host;
    bool has_cast_port = false;
    bool is_google     = false;

    while (std::getline(report_stream, line))
    {
        if (line.find("Nmap scan report for") != std::string::npos)
        {
            if (!current_host.empty() && has_cast_port && is_google)
            {
                candidates.push_back(current_host);
            }

            // Either "for 10.0.0.5" or "for name.lan (10.0.0.5)"; the address is last
            std::istringstream line_stream(line);
            std::string token;
            while (line_stream >> token)
            {
                current_host = token;
            }

            if (!current_host.empty() && current_host[0] == '(')
            {
                current_host.erase(0, 1);
            }

            if (!current_host.empty() && current_host[current_host.size() - 1] == ')')
            {
                current_host.erase(current_host.size() - 1);
            }

            has_cast_port = false;
            is_google     = false;
        }
        else if (current_host.empty())
        {
            continue;
        }
        else if (line.find("8008/tcp open") != std::string::npos ||
                 line.find("8009/tcp open") != std::string::npos)
        {
            has_cast_port = true;
        }
        else if (line.find("MAC Address:") != std::string::npos &&
                 line.find("Google") != std::string::npos)
        {
            is_google = true;
        }
    }

    if (!current_host.empty() && has_cast_port && is_google)
    {
        candidates.push_back(current_host);
    }
}
