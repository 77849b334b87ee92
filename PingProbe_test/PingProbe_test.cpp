#include "PingProbe_test.hpp"

#include "FakeCapabilities.hpp"
#include "PingProbe.hpp"
#include "Test.hpp"
#include "TestMacros.hpp"

TEST_PROGRAM_MAIN(PingProbe_test);

//==============================================================================
void PingProbe_test::addTestCases()
{
    ADD_TEST_CASE(Reachable);
    ADD_TEST_CASE(Unreachable);
}

//==============================================================================
Test::Result PingProbe_test::Reachable::body()
{
    TestLog test_log;
    ScriptedCommandRunner runner;
    PingProbe probe(runner, test_log.event_log, 2);

    if (!probe.isReachable("192.168.1.40"))
    {
        return Test::FAILED;
    }

    if (runner.commands.size() != 1 || runner.commands[0] != "ping -c 1 -W 2 192.168.1.40")
    {
        return Test::FAILED;
    }

    return Test::PASSED;
}

//==============================================================================
Test::Result PingProbe_test::Unreachable::body()
{
    TestLog test_log;
    ScriptedCommandRunner runner;
    PingProbe probe(runner, test_log.event_log, 1);

    runner.respond("ping -c", 1, "1 packets transmitted, 0 received");
    if (probe.isReachable("192.168.1.40"))
    {
        return Test::FAILED;
    }

    runner.refuse("ping -c");
    if (probe.isReachable("192.168.1.40") || !test_log.contains("Cannot run ping"))
    {
        return Test::FAILED;
    }

    return Test::PASSED;
}
