#include <cmath>
#include <cstdint>
#include <gifpipe/encoder_plan.hpp>
#include <gifpipe/errors.hpp>
#include <gifpipe/gif_writer.hpp>
#include <gifpipe/logger.hpp>
#include <gifpipe/settings.hpp>
#include <limits>

#include "process_pipeline.hpp"
#include "stream_writer.hpp"

namespace gifpipe
{

// ─── Validation ──────────────────────────────────────────────────────────────

void validate_options(const FrameSource& clip, const GifOptions& options)
{
    if (options.output_path.empty())
        throw ConfigurationError("output path is empty");

    double duration = clip.duration();
    if (!std::isfinite(duration) || duration <= 0.0)
        throw ConfigurationError("clip has no duration");

    if (std::isnan(options.fps) || options.fps < 0.0)
        throw ConfigurationError("GifOptions::fps must be positive, or 0 to use the clip's fps");

    double fps = options.fps > 0.0 ? options.fps : clip.fps();
    if (!std::isfinite(fps) || fps <= 0.0)
        throw ConfigurationError("no frame rate: set GifOptions::fps or give the clip an fps");

    if (std::floor(duration * fps) >= static_cast<double>(std::numeric_limits<uint32_t>::max()))
        throw ConfigurationError("clip is too long: duration * fps exceeds the frame limit");

    if (clip.width() == 0 || clip.height() == 0)
        throw ConfigurationError("clip has zero width or height");

    if (options.loop < 0)
        throw ConfigurationError("loop count must be >= 0");

    if (options.fuzz < 0 || options.fuzz > 100)
        throw ConfigurationError("fuzz must be a percentage in [0, 100]");

    if (options.colors && (*options.colors < 2 || *options.colors > 256))
        throw ConfigurationError("colors must be in [2, 256]");
}

// ─── Pipe export ─────────────────────────────────────────────────────────────

ExportReport write_gif(const FrameSource&      clip,
                       const GifOptions&       options,
                       const ProgressCallback& progress)
{
    validate_options(clip, options);

    StreamFormat format;
    format.width      = clip.width();
    format.height     = clip.height();
    format.fps        = options.fps > 0.0 ? options.fps : clip.fps();
    format.with_alpha = options.with_mask && clip.has_mask();

    auto plan = build_encoder_plan(options, format, resolve_binaries(options));

    GIFPIPE_LOG_INFO("export",
                     "Building file {} with {} ({} stage(s), optimize={})",
                     options.output_path,
                     to_string(options.program),
                     plan.size(),
                     to_string(options.optimize));

    Pipeline pipeline = Pipeline::start(plan);

    StreamRequest request;
    request.fps             = format.fps;
    request.composite_alpha = format.with_alpha;
    request.destination     = options.output_path;

    StreamStats stats;
    try
    {
        stats = stream_frames(clip, pipeline, request, progress);
    }
    catch (...)
    {
        // Reap every encoder before the error leaves this call.
        pipeline.finish();
        throw;
    }

    if (options.program == GifProgram::ImageMagick)
        GIFPIPE_LOG_INFO("export", "Waiting for ImageMagick to assemble {}", options.output_path);

    auto exits = pipeline.finish();

    ExportReport report;
    report.output_path    = options.output_path;
    report.stage_count    = exits.size();
    report.frames_written = stats.frames_written;
    report.frames_total   = stats.frames_total;
    for (const auto& exit : exits)
        report.exit_codes.push_back(exit.term_signal == 0 ? exit.exit_code : -1);

    GIFPIPE_LOG_INFO("export", "File {} is ready", options.output_path);
    return report;
}

}   // namespace gifpipe
