#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <gifpipe/errors.hpp>
#include <gifpipe/gif_writer.hpp>
#include <gifpipe/settings.hpp>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "util/process_fixture.hpp"

using namespace gifpipe;
using gifpipe::test::no_child_processes;
using gifpipe::test::read_file;
using gifpipe::test::TempDir;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static CallbackClip gradient_clip(uint32_t w, uint32_t h, double fps, double duration)
{
    return CallbackClip(w,
                        h,
                        fps,
                        duration,
                        [w, h](double t)
                        {
                            Frame f(w, h, 3);
                            for (uint32_t y = 0; y < h; ++y)
                            {
                                for (uint32_t x = 0; x < w; ++x)
                                {
                                    size_t idx        = (static_cast<size_t>(y) * w + x) * 3;
                                    f.pixels[idx + 0] = static_cast<uint8_t>((x * 255) / w);
                                    f.pixels[idx + 1] = static_cast<uint8_t>((y * 255) / h);
                                    f.pixels[idx + 2] = static_cast<uint8_t>(static_cast<int>(t * 100) % 256);
                                }
                            }
                            return f;
                        });
}

static bool starts_with_gif_magic(const std::vector<uint8_t>& bytes)
{
    return bytes.size() > 6 && bytes[0] == 'G' && bytes[1] == 'I' && bytes[2] == 'F'
           && bytes[3] == '8';
}

// Loop count stored in the NETSCAPE2.0 application extension, or -1.
static int netscape_loop_count(const std::vector<uint8_t>& bytes)
{
    static const std::string tag = "NETSCAPE2.0";
    auto it = std::search(bytes.begin(), bytes.end(), tag.begin(), tag.end());
    if (it == bytes.end())
        return -1;
    size_t pos = static_cast<size_t>(it - bytes.begin()) + tag.size();
    if (pos + 4 > bytes.size() || bytes[pos] != 3 || bytes[pos + 1] != 1)
        return -1;
    return bytes[pos + 2] | (bytes[pos + 3] << 8);
}

static bool have_encoders()
{
    return !find_program("ffmpeg").empty() && !find_program("convert").empty();
}

// ─── Validation ──────────────────────────────────────────────────────────────

TEST(GifExportValidation, EmptyOutputPath)
{
    auto       clip = gradient_clip(8, 8, 10.0, 1.0);
    GifOptions o;
    EXPECT_THROW(write_gif(clip, o), ConfigurationError);
    EXPECT_TRUE(no_child_processes());
}

TEST(GifExportValidation, ZeroDuration)
{
    auto       clip = gradient_clip(8, 8, 10.0, 0.0);
    GifOptions o;
    o.output_path = "/tmp/never.gif";
    EXPECT_THROW(validate_options(clip, o), ConfigurationError);
}

TEST(GifExportValidation, NoFrameRate)
{
    auto       clip = gradient_clip(8, 8, 0.0, 1.0);
    GifOptions o;
    o.output_path = "/tmp/never.gif";
    EXPECT_THROW(validate_options(clip, o), ConfigurationError);

    o.fps = 12.0;
    EXPECT_NO_THROW(validate_options(clip, o));
}

TEST(GifExportValidation, NonFiniteFps)
{
    auto       clip = gradient_clip(8, 8, std::numeric_limits<double>::infinity(), 1.0);
    GifOptions o;
    o.output_path = "/tmp/never.gif";
    EXPECT_THROW(validate_options(clip, o), ConfigurationError);
}

TEST(GifExportValidation, NegativeOrNanExplicitFps)
{
    auto       clip = gradient_clip(8, 8, 10.0, 1.0);
    GifOptions o;
    o.output_path = "/tmp/never.gif";

    o.fps = -5.0;
    EXPECT_THROW(validate_options(clip, o), ConfigurationError);

    o.fps = std::nan("");
    EXPECT_THROW(validate_options(clip, o), ConfigurationError);

    o.fps = 0.0;
    EXPECT_NO_THROW(validate_options(clip, o));
}

TEST(GifExportValidation, FrameCountLimit)
{
    GifOptions o;
    o.output_path = "/tmp/never.gif";

    // floor(duration * fps) == UINT32_MAX - 1 still fits.
    auto largest = gradient_clip(8, 8, 1.0, 4294967294.0);
    EXPECT_NO_THROW(validate_options(largest, o));

    auto at_limit = gradient_clip(8, 8, 1.0, 4294967295.0);
    EXPECT_THROW(validate_options(at_limit, o), ConfigurationError);

    auto far_past = gradient_clip(8, 8, 1.0, 1e10);
    EXPECT_THROW(validate_options(far_past, o), ConfigurationError);
    EXPECT_THROW(write_gif(far_past, o), ConfigurationError);
    EXPECT_TRUE(no_child_processes());
}

TEST(GifExportValidation, ZeroSize)
{
    auto       clip = gradient_clip(0, 8, 10.0, 1.0);
    GifOptions o;
    o.output_path = "/tmp/never.gif";
    EXPECT_THROW(validate_options(clip, o), ConfigurationError);
}

TEST(GifExportValidation, OptionRanges)
{
    auto       clip = gradient_clip(8, 8, 10.0, 1.0);
    GifOptions o;
    o.output_path = "/tmp/never.gif";
    EXPECT_NO_THROW(validate_options(clip, o));

    GifOptions bad_loop = o;
    bad_loop.loop       = -1;
    EXPECT_THROW(validate_options(clip, bad_loop), ConfigurationError);

    GifOptions bad_fuzz = o;
    bad_fuzz.fuzz       = 101;
    EXPECT_THROW(validate_options(clip, bad_fuzz), ConfigurationError);

    GifOptions few_colors = o;
    few_colors.colors     = 1;
    EXPECT_THROW(validate_options(clip, few_colors), ConfigurationError);

    GifOptions many_colors = o;
    many_colors.colors     = 257;
    EXPECT_THROW(validate_options(clip, many_colors), ConfigurationError);
}

// ─── Failure cleanup ─────────────────────────────────────────────────────────

TEST(GifExportFailure, MissingEncoderRaisesLaunchError)
{
    TempDir    dir("launch");
    auto       clip = gradient_clip(8, 8, 10.0, 1.0);
    GifOptions o;
    o.output_path        = dir.file("out.gif");
    o.program            = GifProgram::ImageMagick;
    o.ffmpeg_binary      = "/bin/cat";
    o.imagemagick_binary = "/nonexistent/gifpipe-convert";

    try
    {
        write_gif(clip, o);
        FAIL() << "expected LaunchError";
    }
    catch (const LaunchError& e)
    {
        EXPECT_EQ(e.program(), "/nonexistent/gifpipe-convert");
    }
    EXPECT_TRUE(no_child_processes());
}

TEST(GifExportFailure, EncoderExitMidStreamRaisesStreamWriteError)
{
    TempDir    dir("midstream");
    auto       clip = gradient_clip(400, 400, 10.0, 3.0);
    GifOptions o;
    o.output_path   = dir.file("out.gif");
    o.program       = GifProgram::FFmpeg;
    o.ffmpeg_binary = "/bin/false";

    try
    {
        write_gif(clip, o);
        FAIL() << "expected StreamWriteError";
    }
    catch (const StreamWriteError& e)
    {
        EXPECT_EQ(e.destination(), o.output_path);
        EXPECT_NE(std::string(e.what()).find(o.output_path), std::string::npos);
    }
    EXPECT_TRUE(no_child_processes());
}

TEST(GifExportFailure, ClipExceptionPropagatesAfterShutdown)
{
    TempDir      dir("clipthrow");
    CallbackClip clip(8,
                      8,
                      10.0,
                      1.0,
                      [](double t) -> Frame
                      {
                          if (t > 0.25)
                              throw std::runtime_error("render failed");
                          return Frame(8, 8, 3);
                      });

    GifOptions o;
    o.output_path   = dir.file("out.gif");
    o.program       = GifProgram::FFmpeg;
    o.ffmpeg_binary = "/bin/sh";   // reads nothing, exits on the bad flags

    EXPECT_THROW(write_gif(clip, o), std::exception);
    EXPECT_TRUE(no_child_processes());
}

// ─── End to end ──────────────────────────────────────────────────────────────

TEST(GifExportEndToEnd, TwoStageImageMagick)
{
    if (!have_encoders())
        GTEST_SKIP() << "ffmpeg and ImageMagick convert are required";

    TempDir    dir("e2e_two");
    auto       clip = gradient_clip(64, 48, 10.0, 2.0);
    GifOptions o;
    o.output_path = dir.file("two.gif");
    o.program     = GifProgram::ImageMagick;
    o.optimize    = GifOptimize::None;

    uint32_t calls = 0;
    auto     report =
        write_gif(clip, o, [&](uint32_t done, uint32_t total)
                  {
                      ++calls;
                      EXPECT_EQ(done, calls);
                      EXPECT_EQ(total, 21u);
                  });

    EXPECT_EQ(report.stage_count, 2u);
    EXPECT_EQ(report.frames_written, 21u);
    EXPECT_EQ(calls, 21u);
    for (int code : report.exit_codes)
        EXPECT_EQ(code, 0);

    EXPECT_TRUE(starts_with_gif_magic(read_file(o.output_path)));
    EXPECT_TRUE(no_child_processes());
}

TEST(GifExportEndToEnd, ThreeStageOptimizedKeepsLoopCount)
{
    if (!have_encoders())
        GTEST_SKIP() << "ffmpeg and ImageMagick convert are required";

    TempDir    dir("e2e_three");
    auto       clip = gradient_clip(64, 48, 10.0, 2.0);
    GifOptions o;
    o.output_path = dir.file("three.gif");
    o.program     = GifProgram::ImageMagick;
    o.optimize    = GifOptimize::OptimizeTransparency;
    o.loop        = 3;
    o.colors      = 32;

    auto report = write_gif(clip, o);
    EXPECT_EQ(report.stage_count, 3u);

    auto bytes = read_file(o.output_path);
    EXPECT_TRUE(starts_with_gif_magic(bytes));
    EXPECT_EQ(netscape_loop_count(bytes), 3);
    EXPECT_TRUE(no_child_processes());
}

TEST(GifExportEndToEnd, MaskedClipThroughFFmpeg)
{
    if (find_program("ffmpeg").empty())
        GTEST_SKIP() << "ffmpeg is required";

    TempDir dir("e2e_ffmpeg");
    auto    clip = gradient_clip(32, 32, 10.0, 1.0);
    clip.set_mask([](double) { return MaskFrame(32, 32, 0.5f); });

    GifOptions o;
    o.output_path = dir.file("ffmpeg.gif");
    o.program     = GifProgram::FFmpeg;

    auto report = write_gif(clip, o);
    EXPECT_EQ(report.stage_count, 1u);
    EXPECT_EQ(report.frames_written, 11u);
    EXPECT_TRUE(starts_with_gif_magic(read_file(o.output_path)));
}

// ─── giflib backend ──────────────────────────────────────────────────────────

#ifdef GIFPIPE_USE_GIFLIB

TEST(GiflibBackend, Available)
{
    EXPECT_TRUE(has_giflib_backend());
}

TEST(GiflibBackend, WritesLoopingGif)
{
    TempDir    dir("giflib");
    auto       clip = gradient_clip(24, 16, 10.0, 1.0);
    GifOptions o;
    o.output_path = dir.file("giflib.gif");
    o.loop        = 2;
    o.colors      = 16;

    uint32_t calls  = 0;
    auto     report = write_gif_with_giflib(clip, o, [&](uint32_t, uint32_t) { ++calls; });

    EXPECT_EQ(report.stage_count, 0u);
    EXPECT_EQ(report.frames_written, 11u);
    EXPECT_EQ(calls, 11u);

    auto bytes = read_file(o.output_path);
    EXPECT_TRUE(starts_with_gif_magic(bytes));
    EXPECT_EQ(netscape_loop_count(bytes), 2);
    EXPECT_EQ(bytes.back(), 0x3B);
}

TEST(GiflibBackend, ValidatesOptions)
{
    auto       clip = gradient_clip(8, 8, 10.0, 1.0);
    GifOptions o;
    EXPECT_THROW(write_gif_with_giflib(clip, o), ConfigurationError);
}

#else

TEST(GiflibBackend, MissingDependencyReported)
{
    EXPECT_FALSE(has_giflib_backend());

    auto       clip = gradient_clip(8, 8, 10.0, 1.0);
    GifOptions o;
    o.output_path = "/tmp/gifpipe_never.gif";
    EXPECT_THROW(write_gif_with_giflib(clip, o), MissingDependencyError);
}

#endif
