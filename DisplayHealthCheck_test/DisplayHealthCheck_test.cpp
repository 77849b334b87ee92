#include "DisplayHealthCheck_test.hpp"

#include "DisplayHealthCheck.hpp"
#include "FakeCapabilities.hpp"
#include "Test.hpp"
#include "TestMacros.hpp"

TEST_PROGRAM_MAIN(DisplayHealthCheck_test);

//==============================================================================
void DisplayHealthCheck_test::addTestCases()
{
    ADD_TEST_CASE(ShowsContent);
    ADD_TEST_CASE(NonAsciiStatus);
    ADD_TEST_CASE(SnapshotFailure);
}

//==============================================================================
Test::Result DisplayHealthCheck_test::ShowsContent::body()
{
    if (!DisplayHealthCheck::showsContent("title: x\ndisplay_name: DashCast\n") ||
        !DisplayHealthCheck::showsContent("APP_ID: 84912283") ||
        !DisplayHealthCheck::showsContent("status_text: Application ready"))
    {
        return Test::FAILED;
    }

    if (DisplayHealthCheck::showsContent("display_name: Backdrop\nstatus_text: ") ||
        DisplayHealthCheck::showsContent(""))
    {
        return Test::FAILED;
    }

    TestLog test_log;
    FakeStatusProbe status_probe;
    DisplayHealthCheck display_health(status_probe, test_log.event_log);

    status_probe.status = "display_name: DashCast";
    if (!display_health.isDisplayShowingContent("192.168.1.40"))
    {
        return Test::FAILED;
    }

    status_probe.status = "display_name: YouTube";
    if (display_health.isDisplayShowingContent("192.168.1.40"))
    {
        return Test::FAILED;
    }

    return Test::PASSED;
}

//==============================================================================
Test::Result DisplayHealthCheck_test::NonAsciiStatus::body()
{
    if (!DisplayHealthCheck::showsContent("title: Men\xc3\xbc \xff\n"
                                          "display_name: DashCast\n"))
    {
        return Test::FAILED;
    }

    if (DisplayHealthCheck::showsContent("display_name: D\xc3\xa1shCast\n"))
    {
        return Test::FAILED;
    }

    return Test::PASSED;
}

//==============================================================================
Test::Result DisplayHealthCheck_test::SnapshotFailure::body()
{
    TestLog test_log;
    FakeStatusProbe status_probe;
    DisplayHealthCheck display_health(status_probe, test_log.event_log);

    // Stale text from an earlier snapshot must not leak through
    status_probe.status = "display_name: DashCast";
    status_probe.succeeds = false;

    if (display_health.isDisplayShowingContent("192.168.1.40") || status_probe.calls != 1)
    {
        return Test::FAILED;
    }

    return Test::PASSED;
}
