#include "metadata_extractor.h"

#include <gtest/gtest.h>

TEST(MetadataExtractorTest, Duration)
{
    EXPECT_EQ(parse_duration("Duration: 01:02:03.00"), 3723);
    EXPECT_EQ(parse_duration("  Duration: 00:00:10.96, start: 0.000000, bitrate: 1205 kb/s"), 10);
}

TEST(MetadataExtractorTest, DurationRequiresFullShape)
{
    EXPECT_FALSE(parse_duration("Duration: N/A, start: 0.000000, bitrate: N/A"));
    EXPECT_FALSE(parse_duration("Duration: 1:02:03.00"));
    EXPECT_FALSE(parse_duration("Duration: 01:02:03"));
    EXPECT_FALSE(parse_duration("duration: 01:02:03.00"));
    EXPECT_FALSE(parse_duration(""));
}

TEST(MetadataExtractorTest, DurationFieldsAreNotRangeChecked)
{
    EXPECT_EQ(parse_duration("Duration: 00:75:00.00"), 4500);
    EXPECT_EQ(parse_progress_time("time=00:00:99.00"), 99);
}

TEST(MetadataExtractorTest, ProgressTime)
{
    EXPECT_EQ(parse_progress_time("frame=  250 fps= 50 q=28.0 size=  1024kB time=00:00:10.00 bitrate= 838.9kbits/s"), 10);
    EXPECT_EQ(parse_progress_time("time=01:00:00.99"), 3600);
    EXPECT_FALSE(parse_progress_time("size=N/A time=N/A bitrate=N/A"));
    EXPECT_FALSE(parse_progress_time("  Duration: 00:00:10.96"));
}

TEST(MetadataExtractorTest, ProgressTimeSkipsUnparsableMarker)
{
    EXPECT_EQ(parse_progress_time("time=N/A elapsed time=00:00:05.00"), 5);
}

TEST(MetadataExtractorTest, SourceName)
{
    EXPECT_EQ(parse_source_name("Input #0, mov,mp4,m4a,3gp,3g2,mj2, from '/media/clips/in.mp4':"), "in.mp4");
    EXPECT_EQ(parse_source_name("Input #0, avi, from 'relative.avi':"), "relative.avi");
    EXPECT_EQ(parse_source_name("Input #0, matroska,webm, from 'C:\\Videos\\movie.mkv':"), "movie.mkv");
}

TEST(MetadataExtractorTest, SourceNameKeepsInnerQuotes)
{
    EXPECT_EQ(parse_source_name("Input #0, mov, from '/tmp/it's here.mov':"), "it's here.mov");
}

TEST(MetadataExtractorTest, SourceNameNeedsClosingQuote)
{
    EXPECT_FALSE(parse_source_name("Output #0, mp4, to 'out.mp4':"));
    EXPECT_FALSE(parse_source_name("Input #0, avi, from 'unterminated.avi"));
    EXPECT_FALSE(parse_source_name("':x from 'a.avi"));
}

TEST(MetadataExtractorTest, FrameRate)
{
    EXPECT_EQ(parse_frame_rate("Stream #0:0: Video: h264, yuv420p, 1920x1080, 25 fps, 25 tbr"), 25);
    EXPECT_EQ(parse_frame_rate("... 25.00 fps ..."), 25);
    EXPECT_EQ(parse_frame_rate("1280x720, 29.97 fps, 29.97 tbr"), 30);
    EXPECT_EQ(parse_frame_rate("23.976 fps"), 24);
    EXPECT_EQ(parse_frame_rate("120 fps"), 120);
}

TEST(MetadataExtractorTest, FrameRateTiesToEven)
{
    EXPECT_EQ(parse_frame_rate("12.5 fps"), 12);
    EXPECT_EQ(parse_frame_rate("13.5 fps"), 14);
}

TEST(MetadataExtractorTest, FrameRateNeedsNumberBeforeUnit)
{
    EXPECT_FALSE(parse_frame_rate("Stream #0:0: Video: h264"));
    EXPECT_FALSE(parse_frame_rate("unknown fps"));
    EXPECT_FALSE(parse_frame_rate("fps=25"));
}

TEST(MetadataExtractorTest, FrameRateOfZeroIsStillAMatch)
{
    EXPECT_EQ(parse_frame_rate("0 fps"), 0);
    EXPECT_EQ(parse_frame_rate("0.4 fps"), 0);
}

TEST(MetadataExtractorTest, FrameRateTakesFirstNumberedOccurrence)
{
    EXPECT_EQ(parse_frame_rate("x fps, 0 fps, 50 fps, 25 fps"), 0);
    EXPECT_EQ(parse_frame_rate("x fps, 50 fps, 25 fps"), 50);
}
