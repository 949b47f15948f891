#include <cstdint>
#include <memory_resource>
#include <optional>
#include <string_view>

#include <gtest/gtest.h>

#include "shade/binding_shadow.hpp"

using namespace std::string_view_literals;

namespace shade {
namespace {

TEST(Binding_Identity, stable)
{
    std::uint64_t expected_x1 = 0xcbf29ce484222325;
    for (const std::uint8_t byte : { 0x78, 0x01, 0x00, 0x00, 0x00 }) {
        expected_x1 ^= byte;
        expected_x1 *= 0x100000001b3;
    }

    EXPECT_EQ(binding_identity(u8"x"sv, 1), binding_identity(u8"x"sv, 1));
    // FNV-1a over 'x', 1, 0, 0, 0
    EXPECT_EQ(binding_identity(u8"x"sv, 1), expected_x1);
}

TEST(Binding_Identity, distinct)
{
    EXPECT_NE(binding_identity(u8"x"sv, 1), binding_identity(u8"x"sv, 2));
    EXPECT_NE(binding_identity(u8"x"sv, 1), binding_identity(u8"y"sv, 1));
    EXPECT_NE(binding_identity(u8"x"sv, 0), binding_identity(u8"x"sv, 1));
}

struct Binding_Shadow_Tracker_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Binding_Shadow_Tracker tracker { &memory };
};

TEST_F(Binding_Shadow_Tracker_Test, advance)
{
    EXPECT_TRUE(tracker.empty());
    EXPECT_EQ(tracker.advance(u8"x"sv), 1);
    EXPECT_EQ(tracker.advance(u8"x"sv), 2);
    EXPECT_EQ(tracker.advance(u8"y"sv), 1);
    EXPECT_EQ(tracker.current(u8"x"sv), 2);
    EXPECT_EQ(tracker.current(u8"y"sv), 1);
}

TEST_F(Binding_Shadow_Tracker_Test, current_without_definition)
{
    EXPECT_EQ(tracker.current(u8"x"sv), std::nullopt);
}

TEST_F(Binding_Shadow_Tracker_Test, clear)
{
    tracker.advance(u8"x"sv);
    tracker.advance(u8"x"sv);
    tracker.clear();
    EXPECT_TRUE(tracker.empty());
    EXPECT_EQ(tracker.current(u8"x"sv), std::nullopt);
    EXPECT_EQ(tracker.advance(u8"x"sv), 1);
}

} // namespace
} // namespace shade
