// tests/test_main.cpp - doctest needs its runner defined in exactly one translation unit

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
