#if !defined ENDPOINT_HEALTH_CHECK_HPP
#define ENDPOINT_HEALTH_CHECK_HPP

#include <chrono>
#include <string>

class EventLog;

// Whether the local content server answers
class EndpointHealthCheck
{
public:

    virtual ~EndpointHealthCheck() {}

    // Never throws; any failure reads as unhealthy
    virtual bool isEndpointHealthy(const std::string& self_address, unsigned short port) = 0;
};

// Issues "GET /" and accepts any 2xx answer arriving before the timeout
class HttpEndpointHealthCheck : public EndpointHealthCheck
{
public:

    HttpEndpointHealthCheck(EventLog&                        log,
                            const std::chrono::milliseconds& timeout =
                            std::chrono::milliseconds(5000));

    virtual ~HttpEndpointHealthCheck();

    virtual bool isEndpointHealthy(const std::string& self_address, unsigned short port);

private:

    EventLog& log;

    // Covers connect, request and response together
    std::chrono::milliseconds timeout;

    HttpEndpointHealthCheck(const HttpEndpointHealthCheck&);
    HttpEndpointHealthCheck& operator=(const HttpEndpointHealthCheck&);
};

#endif
