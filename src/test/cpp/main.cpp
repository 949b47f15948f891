#include <clocale>

#include <gtest/gtest.h>

#include "shade/util/assert.hpp"

namespace {

// Failed assertions are turned into exceptions so that tests can expect them.
[[noreturn]]
void throw_assertion_error(const shade::Assertion_Error& error)
{
    throw error;
}

} // namespace

int main(int argc, char** argv)
{
    std::setlocale(LC_ALL, ".UTF8");
    shade::assertion_handler = &throw_assertion_error;
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
