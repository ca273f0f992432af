#include <algorithm>
#include <cctype>
#include <gifpipe/errors.hpp>
#include <gifpipe/gif_options.hpp>
#include <string>

namespace gifpipe
{

static std::string to_lower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(),
                   out.end(),
                   out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

GifProgram parse_program(std::string_view name)
{
    auto key = to_lower(name);
    if (key == "ffmpeg")
        return GifProgram::FFmpeg;
    if (key == "imagemagick")
        return GifProgram::ImageMagick;
    throw ConfigurationError("unknown GIF program '" + std::string(name)
                             + "' (expected 'ffmpeg' or 'ImageMagick')");
}

GifOptimize parse_optimize(std::string_view name)
{
    auto key = to_lower(name);
    if (key.empty() || key == "none")
        return GifOptimize::None;
    if (key == "optimizeplus")
        return GifOptimize::OptimizePlus;
    if (key == "optimizetransparency")
        return GifOptimize::OptimizeTransparency;
    throw ConfigurationError("unsupported optimization mode '" + std::string(name)
                             + "' (expected 'none', 'OptimizePlus' or 'OptimizeTransparency')");
}

const char* to_string(GifProgram program)
{
    switch (program)
    {
        case GifProgram::FFmpeg:
            return "ffmpeg";
        case GifProgram::ImageMagick:
            return "ImageMagick";
    }
    return "unknown";
}

const char* to_string(GifOptimize optimize)
{
    switch (optimize)
    {
        case GifOptimize::None:
            return "none";
        case GifOptimize::OptimizePlus:
            return "OptimizePlus";
        case GifOptimize::OptimizeTransparency:
            return "OptimizeTransparency";
    }
    return "unknown";
}

}   // namespace gifpipe
