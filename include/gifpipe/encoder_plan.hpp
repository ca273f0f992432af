#pragma once

#include <cstdint>
#include <gifpipe/gif_options.hpp>
#include <gifpipe/settings.hpp>
#include <string>
#include <vector>

namespace gifpipe
{

enum class InputMode
{
    None,   // stdin is /dev/null
    Pipe,   // stdin reads from the previous stage (or the caller for stage 0)
};

enum class OutputMode
{
    None,   // stdout is /dev/null
    Pipe,   // stdout feeds the next stage
    File,   // the program writes the destination itself; stdout is /dev/null
};

// One external encoder invocation. args does not include argv[0].
struct EncoderStageSpec
{
    std::string              program;
    std::vector<std::string> args;
    InputMode                input  = InputMode::Pipe;
    OutputMode               output = OutputMode::File;

    // program followed by args, for logging.
    std::string command_line() const;
};

// Geometry of the raw frames fed into the first stage.
struct StreamFormat
{
    uint32_t width      = 0;
    uint32_t height     = 0;
    double   fps        = 0.0;
    bool     with_alpha = false;
};

// Builds the 1-3 stage encoder chain for an export. Performs no I/O.
//
//   FFmpeg                   : raw --ffmpeg--> gif file
//   ImageMagick, None        : raw --ffmpeg--> bmp stream --convert--> gif file
//   ImageMagick, Optimize*   : raw --ffmpeg--> bmp stream --convert--> gif stream
//                                  --convert -layers--> gif file
std::vector<EncoderStageSpec> build_encoder_plan(const GifOptions&      options,
                                                 const StreamFormat&    format,
                                                 const EncoderBinaries& binaries);

// GIF delay between frames in 1/100 s: round(100 / fps).
int gif_delay_centiseconds(double fps);

// "rgba" or "rgb24".
const char* raw_pixel_format(bool with_alpha);

}   // namespace gifpipe
