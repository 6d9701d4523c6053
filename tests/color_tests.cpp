#include <gtest/gtest.h>
#include "include/color.hpp"

TEST(ColorTests, Smoke_WrapsTextWhenEnabled)
{
    Color::enabled = true;
    EXPECT_EQ(Color::colorize("Warning: x", Color::YELLOW), "\033[33mWarning: x\033[0m");
}

TEST(ColorTests, PlainTextWhenDisabled)
{
    Color::enabled = false;
    auto text = Color::colorize("Error: Unknown option '-z'", Color::RED);
    Color::enabled = true;

    EXPECT_EQ(text, "Error: Unknown option '-z'");
    EXPECT_EQ(text.find('\033'), std::string::npos);
}
