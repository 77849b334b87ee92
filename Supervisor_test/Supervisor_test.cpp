#include <chrono>
#include <cstdlib>
#include <string>

#include "Supervisor_test.hpp"

#include "AddressCache.hpp"
#include "DeviceRecord.hpp"
#include "DeviceResolver.hpp"
#include "DisplayHealthCheck.hpp"
#include "FakeCapabilities.hpp"
#include "Supervisor.hpp"
#include "Test.hpp"
#include "TestMacros.hpp"

TEST_PROGRAM_MAIN(Supervisor_test);

static const char* const DISPLAY_ADDRESS = "192.168.1.40";

static const char* const SHOWING_CONTENT =
    "Title: DashCast\ndisplay_name: DashCast\nstatus_text: Application ready";

static const char* const IDLE = "display_name: Backdrop\nstatus_text: ";

//==============================================================================
static std::string scratchCacheFilename()
{
    char directory_template[] = "/tmp/castkeeper_supervisor_XXXXXX";
    if (mkdtemp(directory_template) == 0)
    {
        return "/tmp/castkeeper_supervisor_device_cache.json";
    }

    return std::string(directory_template) + "/device_cache.json";
}

// Supervisor over fakes, with a display at DISPLAY_ADDRESS that a scan finds
struct SupervisorFixture
{
    SupervisorFixture() :
        cache(scratchCacheFilename(), test_log.event_log),
        resolver(cache,
                 scanner,
                 liveness_probe,
                 sweep_probe,
                 identity_probe,
                 hostname_lookup,
                 local_address,
                 "nest-hub",
                 test_log.event_log),
        display_health(status_probe, test_log.event_log),
        supervisor(resolver,
                   endpoint_health,
                   display_health,
                   content_endpoint,
                   cast_trigger,
                   local_address,
                   SupervisorSettings(),
                   test_log.event_log),
        start(std::chrono::system_clock::now())
    {
        placeDisplay(DISPLAY_ADDRESS);
        status_probe.status = SHOWING_CONTENT;
    }

    // Moves the display to address; its old address goes dark
    void placeDisplay(const std::string& address)
    {
        liveness_probe.reachable.clear();
        identity_probe.identified.clear();
        scanner.candidates.clear();

        liveness_probe.reachable.insert(address);
        identity_probe.identified.insert(address);
        scanner.candidates.push_back(address);
    }

    // Runs the first cycle, leaving the display found and cast to
    bool settle()
    {
        return supervisor.runCycle(start) == std::chrono::seconds(30) &&
            supervisor.getState().known_address == DISPLAY_ADDRESS &&
            supervisor.getState().has_cast;
    }

    TestLog test_log;

    AddressCache cache;

    FakeScanner scanner;

    FakeReachabilityProbe liveness_probe;

    FakeReachabilityProbe sweep_probe;

    FakeIdentityProbe identity_probe;

    FakeHostnameLookup hostname_lookup;

    FakeLocalAddress local_address;

    DeviceResolver resolver;

    FakeEndpointHealthCheck endpoint_health;

    FakeStatusProbe status_probe;

    DisplayHealthCheck display_health;

    FakeContentEndpoint content_endpoint;

    FakeCastTrigger cast_trigger;

    Supervisor supervisor;

    std::chrono::system_clock::time_point start;
};

//==============================================================================
void Supervisor_test::addTestCases()
{
    ADD_TEST_CASE(FirstRunDiscoversAndCasts);
    ADD_TEST_CASE(HealthyCycleTakesNoAction);
    ADD_TEST_CASE(RecastsWhenDisplayIdle);
    ADD_TEST_CASE(CastTimeOnlyRecordedOnSuccess);
    ADD_TEST_CASE(LostAddressCleared);
    ADD_TEST_CASE(PeriodicReverification);
    ADD_TEST_CASE(DisplayMovesToNewAddress);
    ADD_TEST_CASE(DisplayNotFound);
    ADD_TEST_CASE(ServerStartFailure);
    ADD_TEST_CASE(CycleErrorContained);
    ADD_TEST_CASE(EmptyCacheEndToEnd);
    ADD_TEST_CASE(AgedCacheRescans);
}

//==============================================================================
Test::Result Supervisor_test::FirstRunDiscoversAndCasts::body()
{
    SupervisorFixture fixture;

    if (!fixture.settle())
    {
        return Test::FAILED;
    }

    if (fixture.scanner.calls != 1 ||
        fixture.content_endpoint.ensure_calls != 1 ||
        fixture.content_endpoint.last_port != 5500 ||
        fixture.cast_trigger.calls != 1)
    {
        return Test::FAILED;
    }

    if (fixture.cast_trigger.last_address != DISPLAY_ADDRESS ||
        fixture.cast_trigger.last_url != "http://192.168.1.10:5500/")
    {
        return Test::FAILED;
    }

    if (fixture.supervisor.getState().last_cast_at != fixture.start ||
        fixture.supervisor.getState().last_verified_at != fixture.start)
    {
        return Test::FAILED;
    }

    DeviceRecord record;
    if (!fixture.cache.read(record) || record.address != DISPLAY_ADDRESS)
    {
        return Test::FAILED;
    }

    if (!fixture.test_log.contains("Performing initial cast"))
    {
        return Test::FAILED;
    }

    return Test::PASSED;
}

//==============================================================================
Test::Result Supervisor_test::HealthyCycleTakesNoAction::body()
{
    SupervisorFixture fixture;

    if (!fixture.settle())
    {
        return Test::FAILED;
    }

    unsigned int liveness_calls = fixture.liveness_probe.calls;
    unsigned int identity_calls = fixture.identity_probe.calls;

    if (fixture.supervisor.runCycle(fixture.start + std::chrono::seconds(30)) !=
        std::chrono::seconds(30))
    {
        return Test::FAILED;
    }

    if (fixture.scanner.calls != 1 ||
        fixture.liveness_probe.calls != liveness_calls ||
        fixture.identity_probe.calls != identity_calls ||
        fixture.content_endpoint.ensure_calls != 1 ||
        fixture.cast_trigger.calls != 1)
    {
        return Test::FAILED;
    }

    if (!fixture.test_log.contains("All systems healthy"))
    {
        return Test::FAILED;
    }

    return Test::PASSED;
}

//==============================================================================
Test::Result Supervisor_test::RecastsWhenDisplayIdle::body()
{
    SupervisorFixture fixture;

    if (!fixture.settle())
    {
        return Test::FAILED;
    }

    fixture.status_probe.status = IDLE;

    std::chrono::system_clock::time_point later = fixture.start + std::chrono::seconds(30);
    if (fixture.supervisor.runCycle(later) != std::chrono::seconds(30))
    {
        return Test::FAILED;
    }

    if (fixture.cast_trigger.calls != 2 ||
        fixture.content_endpoint.ensure_calls != 2 ||
        fixture.scanner.calls != 1)
    {
        return Test::FAILED;
    }

    if (fixture.supervisor.getState().last_cast_at != later ||
        fixture.supervisor.getState().last_verified_at != later)
    {
        return Test::FAILED;
    }

    if (!fixture.test_log.contains("Recasting due to status issue"))
    {
        return Test::FAILED;
    }

    return Test::PASSED;
}

//==============================================================================
Test::Result Supervisor_test::CastTimeOnlyRecordedOnSuccess::body()
{
    SupervisorFixture fixture;

    if (!fixture.settle())
    {
        return Test::FAILED;
    }

    fixture.status_probe.status = IDLE;
    fixture.cast_trigger.succeeds = false;

    if (fixture.supervisor.runCycle(fixture.start + std::chrono::seconds(30)) !=
        std::chrono::seconds(30))
    {
        return Test::FAILED;
    }

    if (fixture.cast_trigger.calls != 2 ||
        fixture.supervisor.getState().last_cast_at != fixture.start)
    {
        return Test::FAILED;
    }

    return Test::PASSED;
}

//==============================================================================
Test::Result Supervisor_test::LostAddressCleared::body()
{
    SupervisorFixture fixture;

    if (!fixture.settle())
    {
        return Test::FAILED;
    }

    // The display stops answering
    fixture.liveness_probe.reachable.clear();
    fixture.status_probe.succeeds = false;

    if (fixture.supervisor.runCycle(fixture.start + std::chrono::seconds(30)) !=
        std::chrono::seconds(1))
    {
        return Test::FAILED;
    }

    if (!fixture.supervisor.getState().known_address.empty())
    {
        return Test::FAILED;
    }

    // Nothing was started or cast toward the lost address
    if (fixture.content_endpoint.ensure_calls != 1 || fixture.cast_trigger.calls != 1)
    {
        return Test::FAILED;
    }

    return Test::PASSED;
}

//==============================================================================
Test::Result Supervisor_test::PeriodicReverification::body()
{
    SupervisorFixture fixture;

    if (!fixture.settle())
    {
        return Test::FAILED;
    }

    unsigned int liveness_calls = fixture.liveness_probe.calls;

    // Not yet due
    fixture.supervisor.runCycle(fixture.start + std::chrono::seconds(599));
    if (fixture.liveness_probe.calls != liveness_calls)
    {
        return Test::FAILED;
    }

    std::chrono::system_clock::time_point due = fixture.start + std::chrono::seconds(600);
    if (fixture.supervisor.runCycle(due) != std::chrono::seconds(30))
    {
        return Test::FAILED;
    }

    if (fixture.liveness_probe.calls != liveness_calls + 1 ||
        fixture.supervisor.getState().last_verified_at != due)
    {
        return Test::FAILED;
    }

    // Still showing content, so no recast
    if (fixture.cast_trigger.calls != 1)
    {
        return Test::FAILED;
    }

    return Test::PASSED;
}

//==============================================================================
Test::Result Supervisor_test::DisplayMovesToNewAddress::body()
{
    SupervisorFixture fixture;

    if (!fixture.settle())
    {
        return Test::FAILED;
    }

    fixture.placeDisplay("192.168.1.50");
    fixture.status_probe.succeeds = false;

    // The old address fails re-verification
    std::chrono::system_clock::time_point lost = fixture.start + std::chrono::seconds(30);
    if (fixture.supervisor.runCycle(lost) != std::chrono::seconds(1))
    {
        return Test::FAILED;
    }

    fixture.status_probe.succeeds = true;
    fixture.status_probe.status = IDLE;

    // The cached old address fails too, so the network is scanned again
    std::chrono::system_clock::time_point found = lost + std::chrono::seconds(1);
    if (fixture.supervisor.runCycle(found) != std::chrono::seconds(30))
    {
        return Test::FAILED;
    }

    if (fixture.supervisor.getState().known_address != "192.168.1.50" ||
        fixture.scanner.calls != 2 ||
        fixture.cast_trigger.calls != 2 ||
        fixture.cast_trigger.last_address != "192.168.1.50")
    {
        return Test::FAILED;
    }

    DeviceRecord record;
    if (!fixture.cache.read(record) || record.address != "192.168.1.50")
    {
        return Test::FAILED;
    }

    return Test::PASSED;
}

//==============================================================================
Test::Result Supervisor_test::DisplayNotFound::body()
{
    SupervisorFixture fixture;
    fixture.scanner.candidates.clear();

    if (fixture.supervisor.runCycle(fixture.start) != std::chrono::seconds(30))
    {
        return Test::FAILED;
    }

    if (!fixture.supervisor.getState().known_address.empty() ||
        fixture.content_endpoint.ensure_calls != 0 ||
        fixture.cast_trigger.calls != 0)
    {
        return Test::FAILED;
    }

    return Test::PASSED;
}

//==============================================================================
Test::Result Supervisor_test::ServerStartFailure::body()
{
    SupervisorFixture fixture;
    fixture.content_endpoint.starts = false;

    if (fixture.supervisor.runCycle(fixture.start) != std::chrono::seconds(30))
    {
        return Test::FAILED;
    }

    if (fixture.cast_trigger.calls != 0 || fixture.supervisor.getState().has_cast)
    {
        return Test::FAILED;
    }

    // The address is kept for the next cycle
    if (fixture.supervisor.getState().known_address != DISPLAY_ADDRESS)
    {
        return Test::FAILED;
    }

    if (!fixture.test_log.contains("Failed to start web server"))
    {
        return Test::FAILED;
    }

    return Test::PASSED;
}

//==============================================================================
Test::Result Supervisor_test::CycleErrorContained::body()
{
    SupervisorFixture fixture;
    fixture.endpoint_health.throws = true;

    if (fixture.supervisor.runCycle(fixture.start) != std::chrono::seconds(30))
    {
        return Test::FAILED;
    }

    if (!fixture.test_log.contains("Unexpected error in supervision cycle"))
    {
        return Test::FAILED;
    }

    // The address found before the fault is kept, and the next cycle carries on once the
    // fault clears
    fixture.endpoint_health.throws = false;
    fixture.status_probe.status = IDLE;
    if (fixture.supervisor.runCycle(fixture.start + std::chrono::seconds(30)) !=
        std::chrono::seconds(30) || !fixture.supervisor.getState().has_cast)
    {
        return Test::FAILED;
    }

    return Test::PASSED;
}

//==============================================================================
Test::Result Supervisor_test::EmptyCacheEndToEnd::body()
{
    SupervisorFixture fixture;
    fixture.local_address.address = "10.0.0.2";

    fixture.scanner.candidates.clear();
    fixture.scanner.candidates.push_back("10.0.0.5");
    fixture.scanner.candidates.push_back("10.0.0.9");
    fixture.identity_probe.identified.clear();
    fixture.identity_probe.identified.insert("10.0.0.9");
    fixture.liveness_probe.reachable.insert("10.0.0.9");

    if (fixture.supervisor.runCycle(fixture.start) != std::chrono::seconds(30))
    {
        return Test::FAILED;
    }

    if (fixture.supervisor.getState().known_address != "10.0.0.9" ||
        fixture.scanner.last_prefix != "10.0.0")
    {
        return Test::FAILED;
    }

    DeviceRecord record;
    if (!fixture.cache.read(record) ||
        record.address != "10.0.0.9" ||
        record.hostname != "nest-hub")
    {
        return Test::FAILED;
    }

    if (fixture.cast_trigger.calls != 1 ||
        fixture.cast_trigger.last_address != "10.0.0.9" ||
        fixture.cast_trigger.last_url != "http://10.0.0.2:5500/")
    {
        return Test::FAILED;
    }

    return Test::PASSED;
}

//==============================================================================
Test::Result Supervisor_test::AgedCacheRescans::body()
{
    SupervisorFixture fixture;
    fixture.local_address.address = "10.0.0.2";
    fixture.placeDisplay("10.0.0.9");

    if (!fixture.cache.save("10.0.0.9", "nest-hub", fixture.start - std::chrono::hours(25)))
    {
        return Test::FAILED;
    }

    if (fixture.supervisor.runCycle(fixture.start) != std::chrono::seconds(30))
    {
        return Test::FAILED;
    }

    // The aged entry was never probed; the scan found the display instead
    if (fixture.scanner.calls != 1 ||
        fixture.liveness_probe.calls != 0 ||
        fixture.supervisor.getState().known_address != "10.0.0.9")
    {
        return Test::FAILED;
    }

    DeviceRecord record;
    if (!fixture.cache.read(record) || record.last_seen < fixture.start - std::chrono::seconds(1))
    {
        return Test::FAILED;
    }

    return Test::PASSED;
}
