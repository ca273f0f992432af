#include "stream_writer.hpp"

#include <gifpipe/errors.hpp>
#include <gifpipe/logger.hpp>
#include <optional>
#include <system_error>

#include "pixel_compositor.hpp"
#include "process_pipeline.hpp"

namespace gifpipe
{

StreamStats stream_frames(const FrameSource&      clip,
                          Pipeline&               pipeline,
                          const StreamRequest&    request,
                          const ProgressCallback& progress)
{
    StreamStats stats;
    stats.frames_total = total_frame_count(clip.duration(), request.fps);

    const uint32_t width  = clip.width();
    const uint32_t height = clip.height();

    GIFPIPE_LOG_DEBUG("stream",
                      "Streaming {} frames of {}x{} ({}) to {}",
                      stats.frames_total,
                      width,
                      height,
                      raw_pixel_format(request.composite_alpha),
                      request.destination);

    clip.iterate_frames(
        request.fps,
        [&](double t, Frame&& frame)
        {
            std::optional<MaskFrame> mask;
            if (request.composite_alpha && frame.channels == 3)
                mask = clip.get_mask_frame(t);

            Frame raw = prepare_frame(std::move(frame),
                                      mask ? &*mask : nullptr,
                                      request.composite_alpha,
                                      width,
                                      height);

            try
            {
                pipeline.write(raw.pixels.data(), raw.pixels.size());
            }
            catch (const std::system_error& e)
            {
                GIFPIPE_LOG_ERROR("stream",
                                  "Write of frame {} failed: {}",
                                  stats.frames_written + 1,
                                  e.what());
                throw StreamWriteError(request.destination, e.what());
            }

            ++stats.frames_written;
            if (progress)
                progress(stats.frames_written, stats.frames_total);
        });

    if (stats.frames_written != stats.frames_total)
    {
        GIFPIPE_LOG_WARN("stream",
                         "Clip yielded {} frames, expected {}",
                         stats.frames_written,
                         stats.frames_total);
    }

    return stats;
}

}   // namespace gifpipe
