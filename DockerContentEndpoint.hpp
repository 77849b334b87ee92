#if !defined DOCKER_CONTENT_ENDPOINT_HPP
#define DOCKER_CONTENT_ENDPOINT_HPP

#include <chrono>
#include <string>

#include "Capabilities.hpp"

class CommandRunner;
class EventLog;

// Serves the content directory from a web server container, by default Apache httpd
class DockerContentEndpoint : public ContentEndpoint
{
public:

    DockerContentEndpoint(CommandRunner&                  runner,
                          EventLog&                       log,
                          const std::string&              container_name,
                          const std::string&              image,
                          const std::chrono::milliseconds& startup_grace =
                          std::chrono::milliseconds(2000));

    virtual ~DockerContentEndpoint();

    // "docker info" succeeds
    virtual bool isAvailable();

    virtual bool ensureRunning(unsigned short listen_port, const std::string& content_dir);

    virtual void cleanup();

private:

    // Returns false if docker could not be asked; running is only meaningful otherwise
    bool queryContainerRunning(bool& running);

    CommandRunner& runner;

    EventLog& log;

    std::string container_name;

    std::string image;

    // Time given to a freshly started server before it is considered up
    std::chrono::milliseconds startup_grace;

    DockerContentEndpoint(const DockerContentEndpoint&);
    DockerContentEndpoint& operator=(const DockerContentEndpoint&);
};

#endif
