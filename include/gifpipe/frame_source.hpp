#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace gifpipe
{

// Interleaved 8-bit image, row-major with no row padding.
// channels is 3 (RGB) or 4 (RGBA).
struct Frame
{
    uint32_t             width    = 0;
    uint32_t             height   = 0;
    uint32_t             channels = 3;
    std::vector<uint8_t> pixels;

    Frame() = default;
    Frame(uint32_t w, uint32_t h, uint32_t c)
        : width(w), height(h), channels(c), pixels(static_cast<size_t>(w) * h * c, 0)
    {
    }

    size_t pixel_count() const { return static_cast<size_t>(width) * height; }
    size_t byte_size() const { return pixel_count() * channels; }
    bool   is_valid() const { return pixels.size() == byte_size() && byte_size() > 0; }
};

// Per-pixel opacity in [0, 1], same geometry as the color frame.
struct MaskFrame
{
    uint32_t           width  = 0;
    uint32_t           height = 0;
    std::vector<float> alpha;

    MaskFrame() = default;
    MaskFrame(uint32_t w, uint32_t h, float value = 1.0f)
        : width(w), height(h), alpha(static_cast<size_t>(w) * h, value)
    {
    }

    size_t pixel_count() const { return static_cast<size_t>(width) * height; }
};

// Number of frames an export of `duration` seconds at `fps` produces:
// floor(duration * fps) + 1, saturated at UINT32_MAX.
uint32_t total_frame_count(double duration, double fps);

// Timestamp of frame `index` at `fps`, clamped to `duration`.
double frame_time(uint32_t index, double fps, double duration);

// Receives frames in increasing timestamp order. The frame is handed over
// by value; the visitor owns it until it returns.
using FrameVisitor = std::function<void(double t, Frame&& frame)>;

// FrameSource — A clip that renders a frame for any timestamp in
// [0, duration] and optionally an opacity mask for the same timestamp.
class FrameSource
{
   public:
    virtual ~FrameSource() = default;

    virtual double   duration() const = 0;
    virtual double   fps() const      = 0;
    virtual uint32_t width() const    = 0;
    virtual uint32_t height() const   = 0;
    virtual bool     has_mask() const = 0;

    virtual Frame get_frame(double t) const = 0;

    // Returns std::nullopt when the clip has no mask at t.
    virtual std::optional<MaskFrame> get_mask_frame(double t) const = 0;

    // Visits frames lazily at `fps`, rendering one frame per call to the
    // visitor. The default visits t = i / fps for i = 0 .. floor(duration * fps).
    // Exceptions thrown by the visitor stop the iteration and propagate.
    virtual void iterate_frames(double fps, const FrameVisitor& visit) const;
};

// CallbackClip — FrameSource backed by user callbacks.
//
// Usage:
//   CallbackClip clip(64, 48, 10.0, 2.0, [](double t) { ... return frame; });
//   clip.set_mask([](double t) { ... return mask; });
class CallbackClip : public FrameSource
{
   public:
    using FrameFn = std::function<Frame(double t)>;
    using MaskFn  = std::function<MaskFrame(double t)>;

    CallbackClip(uint32_t width, uint32_t height, double fps, double duration, FrameFn frame_fn);

    void set_mask(MaskFn mask_fn) { mask_fn_ = std::move(mask_fn); }

    double   duration() const override { return duration_; }
    double   fps() const override { return fps_; }
    uint32_t width() const override { return width_; }
    uint32_t height() const override { return height_; }
    bool     has_mask() const override { return static_cast<bool>(mask_fn_); }

    Frame                    get_frame(double t) const override;
    std::optional<MaskFrame> get_mask_frame(double t) const override;

   private:
    uint32_t width_;
    uint32_t height_;
    double   fps_;
    double   duration_;
    FrameFn  frame_fn_;
    MaskFn   mask_fn_;
};

}   // namespace gifpipe
