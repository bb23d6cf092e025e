#include "utils.h"

#include <gtest/gtest.h>

TEST(UtilsTest, EndsWith)
{
    EXPECT_TRUE(endsWith("Overwrite? [y/N] ", "[y/N] "));
    EXPECT_TRUE(endsWith("abc", ""));
    EXPECT_FALSE(endsWith("y/N] ", "[y/N] "));
    EXPECT_FALSE(endsWith("[y/N]", "[y/N] "));
}

TEST(UtilsTest, LowercaseCopy)
{
    EXPECT_EQ(lowercase_copy("TrUe"), "true");
    EXPECT_EQ(lowercase_copy("123-ON"), "123-on");
}

TEST(UtilsTest, FileNameComponent)
{
    EXPECT_EQ(file_name_component("/media/clips/in.mp4"), "in.mp4");
    EXPECT_EQ(file_name_component("C:\\Videos\\movie.mkv"), "movie.mkv");
    EXPECT_EQ(file_name_component("plain.avi"), "plain.avi");
    EXPECT_EQ(file_name_component("dir/"), "");
}

TEST(UtilsTest, DisplayWidthCountsCodePoints)
{
    EXPECT_EQ(display_width(""), 0u);
    EXPECT_EQ(display_width("abc"), 3u);
    EXPECT_EQ(display_width("\xC3\xA9t\xC3\xA9"), 3u);          // "été"
    EXPECT_EQ(display_width("\xE2\x96\x88\xE2\x96\x91"), 2u); // two bar glyphs
}

TEST(UtilsTest, FormatClock)
{
    EXPECT_EQ(format_clock(0), "00:00");
    EXPECT_EQ(format_clock(75), "01:15");
    EXPECT_EQ(format_clock(3723), "62:03");
    EXPECT_EQ(format_clock(-5), "00:00");
}
