#pragma once

#include <string>

namespace gifpipe
{

struct GifOptions;

inline constexpr const char* FFMPEG_BINARY_ENV      = "GIFPIPE_FFMPEG_BINARY";
inline constexpr const char* IMAGEMAGICK_BINARY_ENV = "GIFPIPE_IMAGEMAGICK_BINARY";

// Programs used to build encoder stages. Bare names are looked up on PATH
// when the stage is launched.
struct EncoderBinaries
{
    std::string ffmpeg      = "ffmpeg";
    std::string imagemagick = "convert";
};

// Explicit option, then environment variable, then default name.
EncoderBinaries resolve_binaries(const GifOptions& options);

// Returns the path that would be executed for `name`, or an empty string
// if nothing executable is found. Names containing '/' are checked as-is.
std::string find_program(const std::string& name);

}   // namespace gifpipe
