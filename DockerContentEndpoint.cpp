#include <chrono>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "DockerContentEndpoint.hpp"

#include "CommandRunner.hpp"
#include "logging.hpp"

static const std::chrono::seconds QUERY_TIMEOUT(30);

// Image pulls can make "docker run" slow the first time
static const std::chrono::seconds RUN_TIMEOUT(120);

//=============================================================================================
DockerContentEndpoint::DockerContentEndpoint(CommandRunner&                   runner,
                                             EventLog&                        log,
                                             const std::string&               container_name,
                                             const std::string&               image,
                                             const std::chrono::milliseconds& startup_grace) :
    runner(runner),
    log(log),
    container_name(container_name),
    image(image),
    startup_grace(startup_grace)
{
}

//=============================================================================================
DockerContentEndpoint::~DockerContentEndpoint()
{
}

//=============================================================================================
bool DockerContentEndpoint::isAvailable()
{
    std::vector<std::string> arguments;
    arguments.push_back("docker");
    arguments.push_back("info");

    CommandResult result;
    if (!runner.run(arguments, QUERY_TIMEOUT, result))
    {
        if (result.started)
        {
            log.error("Docker is not running");
        }
        else
        {
            log.error("Docker check failed: " + result.error_output);
        }

        return false;
    }

    return true;
}

//=============================================================================================
bool DockerContentEndpoint::ensureRunning(unsigned short     listen_port,
                                          const std::string& content_dir)
{
    // If docker can't say whether the container is up, leave it alone rather than replace a
    // server that may be healthy
    bool running = false;
    if (!queryContainerRunning(running))
    {
        log.warning("Cannot determine whether " + container_name + " is running");
        return false;
    }

    if (running)
    {
        log.info("Web server already running");
        return true;
    }

    // A stopped container of the same name would make "docker run" fail
    std::vector<std::string> remove_arguments;
    remove_arguments.push_back("docker");
    remove_arguments.push_back("rm");
    remove_arguments.push_back("-f");
    remove_arguments.push_back(container_name);

    CommandResult remove_result;
    if (!runner.run(remove_arguments, QUERY_TIMEOUT, remove_result))
    {
        log.debug("No stale " + container_name + " container to remove");
    }

    std::vector<std::string> arguments;
    arguments.push_back("docker");
    arguments.push_back("run");
    arguments.push_back("-d");
    arguments.push_back("--name");
    arguments.push_back(container_name);
    arguments.push_back("-p");
    arguments.push_back(std::to_string(listen_port) + ":80");
    arguments.push_back("-v");
    arguments.push_back(content_dir + ":/usr/local/apache2/htdocs/");
    arguments.push_back(image);

    CommandResult result;
    if (!runner.run(arguments, RUN_TIMEOUT, result))
    {
        log.error("Failed to start web server: " + result.error_output);
        return false;
    }

    std::ostringstream message;
    message << "Web server started on port " << listen_port;
    log.info(message.str());

    std::this_thread::sleep_for(startup_grace);

    return true;
}

//=============================================================================================
// Only the container this program runs is removed; other stopped containers on the host are
// left alone
//=============================================================================================
void DockerContentEndpoint::cleanup()
{
    std::vector<std::string> remove_arguments;
    remove_arguments.push_back("docker");
    remove_arguments.push_back("rm");
    remove_arguments.push_back("-f");
    remove_arguments.push_back(container_name);

    CommandResult remove_result;
    if (!runner.run(remove_arguments, QUERY_TIMEOUT, remove_result))
    {
        log.debug("Container " + container_name + " not removed: " +
                  remove_result.error_output);
    }
}

//=============================================================================================
bool DockerContentEndpoint::queryContainerRunning(bool& running)
{
    running = false;

    std::vector<std::string> arguments;
    arguments.push_back("docker");
    arguments.push_back("ps");
    arguments.push_back("--filter");
    arguments.push_back("name=" + container_name);
    arguments.push_back("--format");
    arguments.push_back("{{.Names}}");

    CommandResult result;
    if (!runner.run(arguments, QUERY_TIMEOUT, result))
    {
        log.debug("Container query failed: " + result.error_output);
        return false;
    }

    // The name filter matches substrings, so look for an exact line
    std::istringstream names(result.output);
    std::string name;
    while (std::getline(names, name))
    {
        if (name == container_name)
        {
            running = true;
            break;
        }
    }

    return true;
}
