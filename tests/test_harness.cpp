#include "minitest.hpp"

// I casi qui sotto non sono registrati: vengono eseguiti a mano con run_one()

TEST(harness_non_std_exception_is_failure) {
    const minitest::TestCase thrower{ "throws_int", [] { throw 42; } };
    ASSERT_FALSE(minitest::run_one(thrower));
}

TEST(harness_assertion_is_failure) {
    const minitest::TestCase failing{ "assert_fails", [] { ASSERT_TRUE(1 == 2); } };
    ASSERT_FALSE(minitest::run_one(failing));
}

TEST(harness_clean_case_passes) {
    const minitest::TestCase clean{ "clean", [] {} };
    ASSERT_TRUE(minitest::run_one(clean));
}
