#include <algorithm>
#include <cmath>
#include <gifpipe/frame_source.hpp>
#include <limits>

namespace gifpipe
{

uint32_t total_frame_count(double duration, double fps)
{
    if (!(duration > 0.0) || !(fps > 0.0))
        return 1;
    constexpr uint32_t max_count = std::numeric_limits<uint32_t>::max();
    const double       steps     = std::floor(duration * fps);
    if (!(steps < static_cast<double>(max_count)))
        return max_count;
    return static_cast<uint32_t>(steps) + 1;
}

double frame_time(uint32_t index, double fps, double duration)
{
    double t = static_cast<double>(index) / fps;
    return std::min(t, duration);
}

void FrameSource::iterate_frames(double fps, const FrameVisitor& visit) const
{
    const double   clip_duration = duration();
    const uint32_t count         = total_frame_count(clip_duration, fps);
    for (uint32_t i = 0; i < count; ++i)
    {
        double t = frame_time(i, fps, clip_duration);
        visit(t, get_frame(t));
    }
}

// ─── CallbackClip ────────────────────────────────────────────────────────────

CallbackClip::CallbackClip(uint32_t width,
                           uint32_t height,
                           double   fps,
                           double   duration,
                           FrameFn  frame_fn)
    : width_(width), height_(height), fps_(fps), duration_(duration), frame_fn_(std::move(frame_fn))
{
}

Frame CallbackClip::get_frame(double t) const
{
    if (!frame_fn_)
        return Frame(width_, height_, 3);
    return frame_fn_(t);
}

std::optional<MaskFrame> CallbackClip::get_mask_frame(double t) const
{
    if (!mask_fn_)
        return std::nullopt;
    return mask_fn_(t);
}

}   // namespace gifpipe
