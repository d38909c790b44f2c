#include "fdm/trim_mode.hpp"
#include <gtest/gtest.h>

using namespace cirrus;

TEST(TrimModeTest, CodesMatchJsbsim) {
    EXPECT_EQ(static_cast<int>(TrimMode::Longitudinal), 0);
    EXPECT_EQ(static_cast<int>(TrimMode::Full), 1);
    EXPECT_EQ(static_cast<int>(TrimMode::Ground), 2);
    EXPECT_EQ(static_cast<int>(TrimMode::None), 6);
}

TEST(TrimModeTest, NamesParseBack) {
    for (int code = 0; code <= 6; ++code) {
        TrimMode mode = static_cast<TrimMode>(code);
        auto parsed = trimModeFromName(trimModeName(mode));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, mode);
    }
}

TEST(TrimModeTest, NameLookupIgnoresCase) {
    auto mode = trimModeFromName("Turn");
    ASSERT_TRUE(mode.has_value());
    EXPECT_EQ(*mode, TrimMode::Turn);
}

TEST(TrimModeTest, RejectsUnknownValues) {
    EXPECT_FALSE(trimModeFromName("barrel-roll").has_value());
    EXPECT_FALSE(trimModeFromCode(-1).has_value());
    EXPECT_FALSE(trimModeFromCode(7).has_value());
    EXPECT_EQ(trimModeFromCode(3), TrimMode::Pullup);
}
