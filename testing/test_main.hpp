#pragma once

// Include this header in exactly ONE .cpp file per test executable.
// It defines main() and hands control to the test registry.
//
// Example:
//   // majority_vote/test.cpp
//   #include "../testing/test_main.hpp"
//   #include "majority_vote.hxx"
//
//   TEST_SUITE("candidate pass")
//   TEST_CASE("single element is its own candidate") { ... }

#include "test_framework.hpp"

auto main() -> int { return ::mjvote::testing::test_registry::instance().run_all(); }
