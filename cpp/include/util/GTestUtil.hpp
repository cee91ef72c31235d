#pragma once

#include <gtest/gtest.h>

/*
 * Dispatches to the standard gtest main function, while adding the LoggingUtil cmdline params.
 *
 * Each unit-test binary's main() is simply:
 *
 * int main(int argc, char** argv) { return launch_gtest(argc, argv); }
 */
int launch_gtest(int argc, char** argv);
