#if !defined PING_PROBE_TEST_HPP
#define PING_PROBE_TEST_HPP

#include "TestCase.hpp"
#include "TestCases.hpp"
#include "TestMacros.hpp"

TEST_CASES_BEGIN(PingProbe_test)

    TEST(Reachable)
    TEST(Unreachable)

TEST_CASES_END(PingProbe_test)

#endif
