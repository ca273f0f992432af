#pragma once

#include <cstdint>
#include <gifpipe/frame_source.hpp>
#include <gifpipe/gif_writer.hpp>
#include <string>

namespace gifpipe
{

class Pipeline;

struct StreamRequest
{
    double      fps             = 0.0;
    bool        composite_alpha = false;
    std::string destination;   // Named in StreamWriteError messages
};

struct StreamStats
{
    uint32_t frames_written = 0;
    uint32_t frames_total   = 0;
};

// Pulls frames from clip at request.fps, composites the mask when
// requested, and writes the raw bytes into the pipeline's first stage.
// progress, if set, is called after every written frame with
// (frames_written, frames_total). frames_total is computed once, up front.
//
// Throws StreamWriteError when a write fails and FrameError when the clip
// yields a frame of the wrong size. Exceptions from the clip propagate.
// Does not shut the pipeline down.
StreamStats stream_frames(const FrameSource&      clip,
                          Pipeline&               pipeline,
                          const StreamRequest&    request,
                          const ProgressCallback& progress);

}   // namespace gifpipe
