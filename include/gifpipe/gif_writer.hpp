#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <gifpipe/frame_source.hpp>
#include <gifpipe/gif_options.hpp>
#include <string>
#include <vector>

namespace gifpipe
{

// Called once per written frame, in order: (frames_done, frames_total).
using ProgressCallback = std::function<void(uint32_t done, uint32_t total)>;

// Summary of a finished export.
struct ExportReport
{
    std::string      output_path;
    size_t           stage_count    = 0;   // Encoder processes launched (0 for giflib)
    uint32_t         frames_written = 0;
    uint32_t         frames_total   = 0;
    std::vector<int> exit_codes;           // Per stage; -1 when killed by a signal
};

// Writes clip to options.output_path as an animated GIF by streaming raw
// frames through a chain of external encoders (see build_encoder_plan).
// Frames are rendered and written one at a time; the whole animation is
// never held in memory.
//
// Throws ConfigurationError (before anything starts), LaunchError,
// StreamWriteError or FrameError. Every launched encoder has exited
// before this returns or throws. A partial output file may remain after
// a failure.
ExportReport write_gif(const FrameSource&      clip,
                       const GifOptions&       options,
                       const ProgressCallback& progress = {});

// Writes clip as a GIF with giflib, one frame at a time, without external
// processes. Uses options.fps, loop, disposal and colors (default 256).
// Throws MissingDependencyError if this build has no giflib support.
ExportReport write_gif_with_giflib(const FrameSource&      clip,
                                   const GifOptions&       options,
                                   const ProgressCallback& progress = {});

// True when write_gif_with_giflib is available in this build.
bool has_giflib_backend();

// Throws ConfigurationError if options cannot be used to export clip.
void validate_options(const FrameSource& clip, const GifOptions& options);

}   // namespace gifpipe
