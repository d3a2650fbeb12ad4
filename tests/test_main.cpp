/**
 * @file test_main.cpp
 * @brief Catch2 runner for the LSV Inspector tests.
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
