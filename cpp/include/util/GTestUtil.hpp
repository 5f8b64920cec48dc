#pragma once

#include <gtest/gtest.h>

// main() of every unit-test executable. Accepts the usual --gtest_* flags plus the logging options
// (listed by --help). Logging to stdout is off unless --log-to-console is given.
//
// Rendering is forced to util::Rendering::kText so that board renderings can be compared against
// plain-text expectations, whether or not the tests run in a terminal.
int launch_gtest(int argc, char** argv);
