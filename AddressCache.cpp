#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <string>
#include <sys/stat.h>
#include <sys/types.h>

#include <json/json.h>

#include "AddressCache.hpp"

#include "NetworkInfo.hpp"
#include "logging.hpp"

const std::chrono::hours AddressCache::STALENESS_HORIZON(24);

//=============================================================================================
AddressCache::AddressCache(const std::string& filename, EventLog& log) :
    filename(filename),
    log(log)
{
}

//=============================================================================================
AddressCache::~AddressCache()
{
}

//=============================================================================================
bool AddressCache::load(const std::chrono::system_clock::time_point& now,
                        DeviceRecord&                                record)
{
    DeviceRecord candidate;
    std::string problem;

    switch (readRecord(candidate, problem))
    {
    case READ_NOT_FOUND:
        log.debug("No cache file found at " + filename);
        return false;

    case READ_MALFORMED:
        log.warning("Ignoring malformed cache file " + filename + ": " + problem);
        return false;

    case READ_OK:
        break;
    }

    if (now - candidate.last_seen >= STALENESS_HORIZON)
    {
        log.info("Cached address " + candidate.address + " too old (last seen " +
                 formatTimestamp(candidate.last_seen) + "), will rescan");
        return false;
    }

    log.info("Loaded cached address " + candidate.address);

    record = candidate;
    return true;
}

//=============================================================================================
bool AddressCache::read(DeviceRecord& record)
{
    std::string problem;
    return readRecord(record, problem) == READ_OK;
}

//=============================================================================================
// Writes to a temporary file first so an interrupted write never leaves a partial record
//=============================================================================================
bool AddressCache::save(const std::string&                           address,
                        const std::string&                           hostname,
                        const std::chrono::system_clock::time_point& now)
{
    if (!networkInfo::isValidHostAddress(address))
    {
        log.warning("Refusing to cache invalid address \"" + address + "\"");
        return false;
    }

    std::string::size_type last_slash = filename.rfind('/');
    if (last_slash != std::string::npos && last_slash > 0)
    {
        std::string directory = filename.substr(0, last_slash);
        if (!makeDirectories(directory))
        {
            log.warning("Failed to save cache: cannot create " + directory + " (" +
                        std::strerror(errno) + ")");
            return false;
        }
    }

    Json::Value root(Json::objectValue);
    root["address"]         = address;
    root["lastSeenISO8601"] = formatTimestamp(now);
    root["hostname"]        = hostname;

    Json::StreamWriterBuilder writer_builder;
    writer_builder["indentation"] = "  ";

    std::string temporary_filename = filename + ".tmp";

    std::ofstream out_stream(temporary_filename.c_str(), std::ofstream::trunc);
    if (!out_stream.is_open())
    {
        log.warning("Failed to save cache: cannot open " + temporary_filename);
        return false;
    }

    out_stream << Json::writeString(writer_builder, root) << "\n";
    out_stream.close();

    if (out_stream.fail())
    {
        log.warning("Failed to save cache: error writing " + temporary_filename);
        std::remove(temporary_filename.c_str());
        return false;
    }

    if (std::rename(temporary_filename.c_str(), filename.c_str()) != 0)
    {
        log.warning("Failed to save cache: cannot replace " + filename + " (" +
                    std::strerror(errno) + ")");
        std::remove(temporary_filename.c_str());
        return false;
    }

    log.debug("Cached address " + address + " to " + filename);
    return true;
}

//=============================================================================================
const std::string& AddressCache::getFilename() const
{
    return filename;
}

//=============================================================================================
std::string AddressCache::formatTimestamp(
    const std::chrono::system_clock::time_point& timestamp)
{
    std::time_t seconds = std::chrono::system_clock::to_time_t(timestamp);

    std::tm utc;
    if (gmtime_r(&seconds, &utc) == 0)
    {
        return "";
    }

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);

    return buffer;
}

//=============================================================================================
bool AddressCache::parseTimestamp(const std::string&                     text,
                                  std::chrono::system_clock::time_point& timestamp)
{
    std::tm broken_down;
    std::memset(&broken_down, 0, sizeof(broken_down));

    const char* rest = strptime(text.c_str(), "%Y-%m-%dT%H:%M:%S", &broken_down);
    if (rest == 0)
    {
        return false;
    }

    // Fractional seconds, kept to microsecond precision
    long microseconds = 0;
    if (*rest == '.')
    {
        ++rest;

        if (!std::isdigit(static_cast<unsigned char>(*rest)))
        {
            return false;
        }

        long scale = 100000;
        while (std::isdigit(static_cast<unsigned char>(*rest)))
        {
            microseconds += (*rest - '0') * scale;
            scale /= 10;
            ++rest;
        }
    }

    std::time_t seconds = 0;

    if (*rest == '\0')
    {
        broken_down.tm_isdst = -1;
        seconds = std::mktime(&broken_down);
    }
    else if (*rest == 'Z' && *(rest + 1) == '\0')
    {
        seconds = timegm(&broken_down);
    }
    else if ((*rest == '+' || *rest == '-') && std::strlen(rest) == 6 &&
             std::isdigit(static_cast<unsigned char>(rest[1])) &&
             std::isdigit(static_cast<unsigned char>(rest[2])) &&
             rest[3] == ':' &&
             std::isdigit(static_cast<unsigned char>(rest[4])) &&
             std::isdigit(static_cast<unsigned char>(rest[5])))
    {
        int hours   = (rest[1] - '0') * 10 + (rest[2] - '0');
        int minutes = (rest[4] - '0') * 10 + (rest[5] - '0');
        int sign    = *rest == '+' ? 1 : -1;

        seconds = timegm(&broken_down) - sign * (hours * 3600 + minutes * 60);
    }
    else
    {
        return false;
    }

    timestamp = std::chrono::system_clock::from_time_t(seconds) +
        std::chrono::microseconds(microseconds);

    return true;
}

//=============================================================================================
AddressCache::ReadResult AddressCache::readRecord(DeviceRecord& record, std::string& problem)
{
    std::ifstream in_stream(filename.c_str());
    if (!in_stream.is_open())
    {
        return READ_NOT_FOUND;
    }

    Json::CharReaderBuilder reader_builder;
    Json::Value root;
    std::string errors;

    if (!Json::parseFromStream(reader_builder, in_stream, &root, &errors))
    {
        problem = "not valid JSON";
        return READ_MALFORMED;
    }

    if (!root.isObject())
    {
        problem = "not a JSON object";
        return READ_MALFORMED;
    }

    const Json::Value& address   = root["address"];
    const Json::Value& last_seen = root["lastSeenISO8601"];
    const Json::Value& hostname  = root["hostname"];

    if (!address.isString() || !last_seen.isString())
    {
        problem = "address or lastSeenISO8601 missing";
        return READ_MALFORMED;
    }

    if (!networkInfo::isValidHostAddress(address.asString()))
    {
        problem = "invalid address \"" + address.asString() + "\"";
        return READ_MALFORMED;
    }

    std::chrono::system_clock::time_point last_seen_time;
    if (!parseTimestamp(last_seen.asString(), last_seen_time))
    {
        problem = "invalid timestamp \"" + last_seen.asString() + "\"";
        return READ_MALFORMED;
    }

    record.address   = address.asString();
    record.hostname  = hostname.isString() ? hostname.asString() : "";
    record.last_seen = last_seen_time;

    return READ_OK;
}

//=============================================================================================
// Equivalent of mkdir -p
//=============================================================================================
bool AddressCache::makeDirectories(const std::string& path)
{
    std::string::size_type position = 0;

    while (position != std::string::npos)
    {
        position = path.find('/', position + 1);

        std::string partial = path.substr(0, position);
        if (partial.empty())
        {
            continue;
        }

        if (mkdir(partial.c_str(), 0755) == -1 && errno != EEXIST)
        {
            return false;
        }
    }

    struct stat info;
    return stat(path.c_str(), &info) == 0 && S_ISDIR(info.st_mode);
}
