#include <cmath>
#include <cstdio>
#include <gifpipe/encoder_plan.hpp>
#include <sstream>

namespace gifpipe
{

std::string EncoderStageSpec::command_line() const
{
    std::ostringstream cmd;
    cmd << program;
    for (const auto& arg : args)
        cmd << " " << arg;
    return cmd.str();
}

int gif_delay_centiseconds(double fps)
{
    return static_cast<int>(std::lround(100.0 / fps));
}

const char* raw_pixel_format(bool with_alpha)
{
    return with_alpha ? "rgba" : "rgb24";
}

// ffmpeg writes its rates with two decimals, e.g. "10.00".
static std::string format_rate(double fps)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.02f", fps);
    return buf;
}

// ffmpeg reading raw frames from stdin:
//   ffmpeg -y -loglevel error -f rawvideo -vcodec rawvideo -r FPS
//          -s WxH -pix_fmt PIX_FMT -i -
static EncoderStageSpec raw_frame_reader(const StreamFormat& format, const std::string& ffmpeg)
{
    EncoderStageSpec spec;
    spec.program = ffmpeg;
    spec.args    = {"-y",
                    "-loglevel",
                    "error",
                    "-f",
                    "rawvideo",
                    "-vcodec",
                    "rawvideo",
                    "-r",
                    format_rate(format.fps),
                    "-s",
                    std::to_string(format.width) + "x" + std::to_string(format.height),
                    "-pix_fmt",
                    raw_pixel_format(format.with_alpha),
                    "-i",
                    "-"};
    spec.input = InputMode::Pipe;
    return spec;
}

std::vector<EncoderStageSpec> build_encoder_plan(const GifOptions&      options,
                                                 const StreamFormat&    format,
                                                 const EncoderBinaries& binaries)
{
    std::vector<EncoderStageSpec> plan;

    if (options.program == GifProgram::FFmpeg)
    {
        EncoderStageSpec encode = raw_frame_reader(format, binaries.ffmpeg);
        encode.args.insert(encode.args.end(),
                           {"-pix_fmt",
                            raw_pixel_format(format.with_alpha),
                            "-r",
                            format_rate(format.fps),
                            options.output_path});
        encode.output = OutputMode::File;
        plan.push_back(std::move(encode));
        return plan;
    }

    // ImageMagick chain. Stage 1 turns raw frames into a BMP stream.
    EncoderStageSpec decode = raw_frame_reader(format, binaries.ffmpeg);
    decode.args.insert(decode.args.end(), {"-f", "image2pipe", "-vcodec", "bmp", "-"});
    decode.output = OutputMode::Pipe;
    plan.push_back(std::move(decode));

    // Stage 2 assembles the BMP stream into a GIF.
    EncoderStageSpec assemble;
    assemble.program = binaries.imagemagick;
    assemble.args    = {"-delay",
                        std::to_string(gif_delay_centiseconds(format.fps)),
                        "-dispose",
                        std::to_string(static_cast<int>(options.disposal)),
                        "-loop",
                        std::to_string(options.loop),
                        "-",
                        "-coalesce"};
    assemble.input   = InputMode::Pipe;

    if (options.optimize == GifOptimize::None)
    {
        assemble.args.push_back(options.output_path);
        assemble.output = OutputMode::File;
        plan.push_back(std::move(assemble));
        return plan;
    }

    assemble.args.push_back("gif:-");
    assemble.output = OutputMode::Pipe;
    plan.push_back(std::move(assemble));

    // Stage 3 optimizes layers and caps the palette.
    EncoderStageSpec optimize;
    optimize.program = binaries.imagemagick;
    optimize.args    = {"-",
                        "-layers",
                        to_string(options.optimize),
                        "-fuzz",
                        std::to_string(options.fuzz) + "%"};
    if (options.colors)
    {
        optimize.args.push_back("-colors");
        optimize.args.push_back(std::to_string(*options.colors));
    }
    optimize.args.push_back(options.output_path);
    optimize.input  = InputMode::Pipe;
    optimize.output = OutputMode::File;
    plan.push_back(std::move(optimize));

    return plan;
}

}   // namespace gifpipe
