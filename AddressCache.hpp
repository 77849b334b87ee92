#if !defined ADDRESS_CACHE_HPP
#define ADDRESS_CACHE_HPP

#include <chrono>
#include <string>

#include "DeviceRecord.hpp"

class EventLog;

// Persists the last discovered display address as a small JSON document:
//
//   { "address": "192.168.1.40", "lastSeenISO8601": "2024-05-01T10:00:00Z",
//     "hostname": "nest-hub" }
//
// Records are never deleted.  Once older than the staleness horizon they stop being returned
// by load() but remain readable through read().
class AddressCache
{
public:

    AddressCache(const std::string& filename, EventLog& log);

    ~AddressCache();

    // Fills in record and returns true only if a well-formed record exists and was last seen
    // less than STALENESS_HORIZON before now
    bool load(const std::chrono::system_clock::time_point& now, DeviceRecord& record);

    // Reads the persisted record whatever its age
    bool read(DeviceRecord& record);

    // Replaces the persisted record, stamping it with now.  Missing directories are created.
    // Failure is logged and reported but never thrown.
    bool save(const std::string&                           address,
              const std::string&                           hostname,
              const std::chrono::system_clock::time_point& now);

    const std::string& getFilename() const;

    // Formats as UTC, e.g. "2024-05-01T10:00:00Z"
    static std::string formatTimestamp(const std::chrono::system_clock::time_point& timestamp);

    // Accepts optional fractional seconds and either "Z", "+HH:MM"/"-HH:MM" or no suffix; no
    // suffix is interpreted as local time
    static bool parseTimestamp(const std::string&                     text,
                               std::chrono::system_clock::time_point& timestamp);

    static const std::chrono::hours STALENESS_HORIZON;

private:

    enum ReadResult
    {
        READ_OK,
        READ_NOT_FOUND,
        READ_MALFORMED
    };

    ReadResult readRecord(DeviceRecord& record, std::string& problem);

    static bool makeDirectories(const std::string& path);

    std::string filename;

    EventLog& log;

    AddressCache(const AddressCache&);
    AddressCache& operator=(const AddressCache&);
};

#endif
