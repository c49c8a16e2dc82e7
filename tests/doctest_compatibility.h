#ifndef DOCTEST_COMPATIBILITY_H
#define DOCTEST_COMPATIBILITY_H

// Lets the tests use Catch-style sections on top of doctest.

#include <doctest/doctest.h>

#define SECTION(name) DOCTEST_SUBCASE(name)

#endif  // DOCTEST_COMPATIBILITY_H
