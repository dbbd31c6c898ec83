
#ifndef TESTING_H
#define TESTING_H

#include <iostream>
#include <cmath>

inline size_t testing_failures = 0;

// If macro argument is not true, test is failing
#define IS_TRUE(x) { \
    if (!(x)) { \
        ++testing_failures; \
        std::cout << __PRETTY_FUNCTION__ << " failed on line " << __LINE__ << std::endl;\
    } else { \
        std::cout << __PRETTY_FUNCTION__ << " passed on line " << __LINE__ << std::endl;\
    } \
}

// If the statement does not throw ERR (or a subclass), test is failing
#define THROWS(stmt, ERR) { \
    bool _thrown = false; \
    try { stmt; } catch (const ERR &) { _thrown = true; } \
    IS_TRUE(_thrown); \
}

#define IS_CLOSE(x, y, tol) IS_TRUE(std::abs((x) - (y)) < (tol))

// exit status for main(): nonzero if anything failed
#define TEST_RESULT() (testing_failures == 0 ? 0 : 1)

#endif
