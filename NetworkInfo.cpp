#include <arpa/inet.h>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <memory>
#include <mutex>
#include <netdb.h>
#include <netinet/in.h>
#include <sstream>
#include <string>
#include <sys/socket.h>
#include <system_error>
#include <thread>
#include <unistd.h>

#include "NetworkInfo.hpp"

//=============================================================================================
bool networkInfo::isValidHostAddress(const std::string& address)
{
    unsigned char buffer[sizeof(in6_addr)];

    return inet_pton(AF_INET,  address.c_str(), buffer) == 1 ||
           inet_pton(AF_INET6, address.c_str(), buffer) == 1;
}

//=============================================================================================
bool networkInfo::subnetPrefix24(const std::string& address, std::string& prefix)
{
    in_addr parsed;
    if (inet_pton(AF_INET, address.c_str(), &parsed) != 1)
    {
        return false;
    }

    const unsigned char* octets = reinterpret_cast<const unsigned char*>(&parsed.s_addr);

    std::ostringstream out_stream;
    out_stream << static_cast<unsigned int>(octets[0]) << "."
               << static_cast<unsigned int>(octets[1]) << "."
               << static_cast<unsigned int>(octets[2]);

    prefix = out_stream.str();
    return true;
}

//=============================================================================================
RoutingLocalAddress::RoutingLocalAddress()
{
}

//=============================================================================================
RoutingLocalAddress::~RoutingLocalAddress()
{
}

//=============================================================================================
bool RoutingLocalAddress::getLocalAddress(std::string& address)
{
    int socket_fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (socket_fd == -1)
    {
        return false;
    }

    sockaddr_in remote;
    std::memset(&remote, 0, sizeof(remote));
    remote.sin_family = AF_INET;
    remote.sin_port   = htons(80);
    inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr);

    // Connecting a datagram socket only selects a route and a source address
    if (connect(socket_fd, reinterpret_cast<sockaddr*>(&remote), sizeof(remote)) == -1)
    {
        close(socket_fd);
        return false;
    }

    sockaddr_in local;
    socklen_t local_length = sizeof(local);
    if (getsockname(socket_fd, reinterpret_cast<sockaddr*>(&local), &local_length) == -1)
    {
        close(socket_fd);
        return false;
    }

    close(socket_fd);

    char address_cstr[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &local.sin_addr, address_cstr, INET_ADDRSTRLEN) == 0)
    {
        return false;
    }

    address = address_cstr;
    return true;
}

// Shared between a lookup and the worker thread doing it, which may outlive the lookup
struct PendingLookup
{
    PendingLookup() :
        done(false),
        found(false)
    {
    }

    std::mutex mutex;

    std::condition_variable finished;

    bool done;

    bool found;

    std::string hostname;
};

//=============================================================================================
static void runLookup(ReverseDnsLookup::ResolveFunction resolver,
                      const std::string                 address,
                      std::shared_ptr<PendingLookup>    pending)
{
    std::string hostname;
    bool found = resolver(address, hostname);

    std::lock_guard<std::mutex> lock(pending->mutex);
    pending->done     = true;
    pending->found    = found;
    pending->hostname = hostname;
    pending->finished.notify_one();
}

//=============================================================================================
ReverseDnsLookup::ReverseDnsLookup(const std::chrono::milliseconds& timeout,
                                   ResolveFunction                  resolver) :
    timeout(timeout),
    resolver(resolver)
{
}

//=============================================================================================
ReverseDnsLookup::~ReverseDnsLookup()
{
}

//=============================================================================================
bool ReverseDnsLookup::lookup(const std::string& address, std::string& hostname)
{
    std::shared_ptr<PendingLookup> pending(new PendingLookup());

    try
    {
        std::thread(runLookup, resolver, address, pending).detach();
    }
    catch (std::system_error&)
    {
        return false;
    }

    const std::chrono::steady_clock::time_point deadline =
        std::chrono::steady_clock::now() + timeout;

    std::unique_lock<std::mutex> lock(pending->mutex);
    while (!pending->done && std::chrono::steady_clock::now() < deadline)
    {
        pending->finished.wait_until(lock, deadline);
    }

    if (!pending->done || !pending->found)
    {
        return false;
    }

    hostname = pending->hostname;
    return true;
}

//=============================================================================================
bool ReverseDnsLookup::resolveWithSystem(const std::string& address, std::string& hostname)
{
    sockaddr_storage storage;
    std::memset(&storage, 0, sizeof(storage));
    socklen_t storage_length = 0;

    sockaddr_in*  ipv4 = reinterpret_cast<sockaddr_in*>(&storage);
    sockaddr_in6* ipv6 = reinterpret_cast<sockaddr_in6*>(&storage);

    if (inet_pton(AF_INET, address.c_str(), &ipv4->sin_addr) == 1)
    {
        ipv4->sin_family = AF_INET;
        storage_length = sizeof(sockaddr_in);
    }
    else if (inet_pton(AF_INET6, address.c_str(), &ipv6->sin6_addr) == 1)
    {
        ipv6->sin6_family = AF_INET6;
        storage_length = sizeof(sockaddr_in6);
    }
    else
    {
        return false;
    }

    char host_cstr[NI_MAXHOST];
    if (getnameinfo(reinterpret_cast<sockaddr*>(&storage),
                    storage_length,
                    host_cstr,
                    NI_MAXHOST,
                    0,
                    0,
                    NI_NAMEREQD) != 0)
    {
        return false;
    }

    hostname = host_cstr;
    return true;
}
