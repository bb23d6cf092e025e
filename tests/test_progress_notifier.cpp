#include "progress_notifier.h"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

namespace
{
    ProgressNotifier::Options test_options()
    {
        ProgressNotifier::Options options;
        options.barWidth = 10;
        options.asciiGlyphs = true;
        options.now = []
        { return ProgressBar::Clock::time_point(); };
        return options;
    }

    void feed(ProgressNotifier &notifier, const std::string &text)
    {
        for (char c : text)
            notifier.processChar(c);
    }

    const char kInputHeader[] = "Input #0, mov,mp4,m4a,3gp,3g2,mj2, from '/media/clips/in.mp4':\n";
    const char kDuration[] = "  Duration: 01:02:03.00, start: 0.000000, bitrate: 1205 kb/s\n";
    const char kVideoStream[] = "    Stream #0:0(und): Video: h264 (High), yuv420p, 1920x1080, 25.00 fps, 25 tbr, 12800 tbn\n";
    const char kOverwrite[] = "File 'out.mp4' already exists. Overwrite? [y/N] ";
}

TEST(ProgressNotifierTest, DurationIsLatched)
{
    std::ostringstream out;
    ProgressNotifier notifier(out, test_options());

    feed(notifier, "Duration: 01:02:03.00\n");
    ASSERT_TRUE(notifier.durationSeconds());
    EXPECT_EQ(*notifier.durationSeconds(), 3723);

    feed(notifier, "Duration: 00:00:05.00\n");
    EXPECT_EQ(*notifier.durationSeconds(), 3723);
}

TEST(ProgressNotifierTest, NoBarBeforeProgress)
{
    std::ostringstream out;
    ProgressNotifier notifier(out, test_options());

    feed(notifier, kInputHeader);
    feed(notifier, kDuration);
    EXPECT_EQ(notifier.progressBar(), nullptr);
    EXPECT_TRUE(out.str().empty());
}

TEST(ProgressNotifierTest, SecondsWithoutFrameRate)
{
    std::ostringstream out;
    ProgressNotifier notifier(out, test_options());

    feed(notifier, kDuration);
    feed(notifier, "size=     256kB time=00:00:10.00 bitrate= 209.7kbits/s speed=2.0x\r");

    const ProgressBar *bar = notifier.progressBar();
    ASSERT_NE(bar, nullptr);
    EXPECT_EQ(bar->totalTicks(), 3723);
    EXPECT_EQ(bar->currentTick(), 10);
    EXPECT_NE(out.str().find("Processing: 0% |----------| 10/3723 seconds"), std::string::npos);
}

TEST(ProgressNotifierTest, FramesWithFrameRate)
{
    std::ostringstream out;
    ProgressNotifier notifier(out, test_options());

    feed(notifier, kInputHeader);
    feed(notifier, kDuration);
    feed(notifier, kVideoStream);
    feed(notifier, "time=00:00:02.00\r");

    ASSERT_TRUE(notifier.framesPerSecond());
    EXPECT_EQ(*notifier.framesPerSecond(), 25);
    ASSERT_TRUE(notifier.sourceName());
    EXPECT_EQ(*notifier.sourceName(), "in.mp4");

    const ProgressBar *bar = notifier.progressBar();
    ASSERT_NE(bar, nullptr);
    EXPECT_EQ(bar->totalTicks(), 3723 * 25);
    EXPECT_EQ(bar->currentTick(), 50);
    EXPECT_NE(out.str().find("in.mp4: 0% |----------| 50/93075 frames"), std::string::npos);
}

TEST(ProgressNotifierTest, UnknownDurationIsUnbounded)
{
    std::ostringstream out;
    ProgressNotifier notifier(out, test_options());

    feed(notifier, "time=00:00:07.00\r");

    const ProgressBar *bar = notifier.progressBar();
    ASSERT_NE(bar, nullptr);
    EXPECT_EQ(bar->totalTicks(), ProgressBar::kUnbounded);
    EXPECT_EQ(bar->currentTick(), 7);
}

TEST(ProgressNotifierTest, ProgressNeverGoesBack)
{
    std::ostringstream out;
    ProgressNotifier notifier(out, test_options());

    feed(notifier, kDuration);
    feed(notifier, "time=00:00:20.00\r");
    feed(notifier, "time=00:00:15.00\r");
    EXPECT_EQ(notifier.progressBar()->currentTick(), 20);

    feed(notifier, "time=00:00:30.00\r");
    EXPECT_EQ(notifier.progressBar()->currentTick(), 30);
}

TEST(ProgressNotifierTest, ProgressClampedToDuration)
{
    std::ostringstream out;
    ProgressNotifier notifier(out, test_options());

    feed(notifier, "Duration: 00:00:10.00\n");
    feed(notifier, "time=00:00:12.00\r");
    EXPECT_EQ(notifier.progressBar()->currentTick(), 10);
}

TEST(ProgressNotifierTest, LateFrameRateScalesMarkersButKeepsBarTotal)
{
    std::ostringstream out;
    ProgressNotifier notifier(out, test_options());

    feed(notifier, kDuration);
    feed(notifier, "time=00:00:01.00\r");
    feed(notifier, kVideoStream);
    feed(notifier, "time=00:00:02.00\r");

    const ProgressBar *bar = notifier.progressBar();
    ASSERT_NE(bar, nullptr);
    EXPECT_EQ(bar->totalTicks(), 3723);
    EXPECT_EQ(bar->currentTick(), 2 * 25);
    EXPECT_EQ(out.str().find("frames"), std::string::npos);
}

TEST(ProgressNotifierTest, PromptWithoutBar)
{
    std::ostringstream out;
    ProgressNotifier notifier(out, test_options());

    feed(notifier, kOverwrite);
    EXPECT_EQ(out.str(), kOverwrite);
    EXPECT_EQ(notifier.lastLine(), kOverwrite);
}

TEST(ProgressNotifierTest, PromptMovesOffTheBar)
{
    std::ostringstream out;
    ProgressNotifier notifier(out, test_options());

    feed(notifier, "time=00:00:01.00\r");
    out.str("");
    feed(notifier, kOverwrite);
    EXPECT_EQ(out.str(), std::string("\n") + kOverwrite);
}

TEST(ProgressNotifierTest, LastLineIsLastCompletedLine)
{
    std::ostringstream out;
    ProgressNotifier notifier(out, test_options());

    feed(notifier, "a\nb\nc");
    EXPECT_EQ(notifier.lastLine(), "b");
}

TEST(ProgressNotifierTest, CloseWithoutBarIsNoop)
{
    std::ostringstream out;
    ProgressNotifier notifier(out, test_options());

    feed(notifier, "ffmpeg version 6.1\n");
    EXPECT_NO_THROW(notifier.close());
    EXPECT_NO_THROW(notifier.close());
    EXPECT_TRUE(out.str().empty());
}

TEST(ProgressNotifierTest, CloseFinishesBar)
{
    std::ostringstream out;
    ProgressNotifier notifier(out, test_options());

    feed(notifier, "Duration: 00:00:10.00\n");
    feed(notifier, "time=00:00:04.00\r");
    notifier.close();

    ASSERT_NE(notifier.progressBar(), nullptr);
    EXPECT_TRUE(notifier.progressBar()->isClosed());
    EXPECT_EQ(notifier.progressBar()->currentTick(), 10);
    EXPECT_NE(out.str().find("Processing: 100% |##########| 10/10 seconds\n"), std::string::npos);

    const std::string once = out.str();
    notifier.close();
    EXPECT_EQ(out.str(), once);
}
