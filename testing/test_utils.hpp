#ifndef TEST_UTILS_HPP
#define TEST_UTILS_HPP

// tests rely on assert, so never let a release build strip it
#undef NDEBUG
#include <cassert>
#include <chrono>
#include <iostream>

// runs a test function, reporting its name and duration.
// expects a constexpr bool ENABLE_DEBUG_LOGS in the calling scope.
#define TEST(a_test_fn)                                                        \
    {                                                                          \
        if(ENABLE_DEBUG_LOGS)                                                  \
            std::cout << "[ RUN  ] " << #a_test_fn << std::endl;               \
        auto l_test_start = std::chrono::steady_clock::now();                  \
        a_test_fn();                                                           \
        auto l_test_ms =                                                       \
            std::chrono::duration_cast<std::chrono::milliseconds>(             \
                std::chrono::steady_clock::now() - l_test_start)               \
                .count();                                                      \
        if(ENABLE_DEBUG_LOGS)                                                  \
            std::cout << "[  OK  ] " << #a_test_fn << " (" << l_test_ms       \
                      << " ms)" << std::endl;                                  \
    }

#endif
