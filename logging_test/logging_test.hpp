#if !defined LOGGING_TEST_HPP
#define LOGGING_TEST_HPP

#include "TestCase.hpp"
#include "TestCases.hpp"
#include "TestMacros.hpp"

TEST_CASES_BEGIN(logging_test)

    TEST(Threshold)
    TEST(ParseLevel)

TEST_CASES_END(logging_test)

#endif
