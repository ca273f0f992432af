#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gifpipe
{

// Encoder chain used by write_gif.
enum class GifProgram
{
    FFmpeg,        // frames --ffmpeg--> gif
    ImageMagick,   // frames --ffmpeg--> bmp --convert--> gif [--convert--> optimized gif]
};

// ImageMagick layer optimization applied by the third stage.
enum class GifOptimize
{
    None,
    OptimizePlus,
    OptimizeTransparency,
};

// GIF frame disposal codes as passed to ImageMagick's -dispose.
enum class Disposal : int
{
    DoNotDispose      = 1,
    RestoreBackground = 2,
};

// Options for a GIF export.
struct GifOptions
{
    std::string output_path;

    double fps = 0.0;   // 0 = use the clip's fps

    GifProgram  program  = GifProgram::ImageMagick;
    GifOptimize optimize = GifOptimize::OptimizeTransparency;

    int      fuzz     = 1;   // Percent; colors closer than this are merged
    int      loop     = 0;   // 0 = loop forever
    Disposal disposal = Disposal::RestoreBackground;

    std::optional<uint32_t> colors;   // Palette cap (2..256)

    bool with_mask = true;   // Encode the clip's mask as alpha if it has one

    // Encoder binaries. Empty = $GIFPIPE_FFMPEG_BINARY / $GIFPIPE_IMAGEMAGICK_BINARY,
    // then "ffmpeg" / "convert".
    std::string ffmpeg_binary;
    std::string imagemagick_binary;
};

// Case-insensitive. Accepts "ffmpeg" and "imagemagick".
// Throws ConfigurationError for anything else.
GifProgram parse_program(std::string_view name);

// Case-insensitive. Accepts "none", "optimizeplus" and "optimizetransparency".
// Throws ConfigurationError for anything else.
GifOptimize parse_optimize(std::string_view name);

const char* to_string(GifProgram program);
const char* to_string(GifOptimize optimize);

}   // namespace gifpipe
