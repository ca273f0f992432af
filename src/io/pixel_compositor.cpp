#include "pixel_compositor.hpp"

#include <algorithm>
#include <cmath>
#include <gifpipe/errors.hpp>
#include <string>

namespace gifpipe
{

static std::string geometry(uint32_t w, uint32_t h)
{
    return std::to_string(w) + "x" + std::to_string(h);
}

uint8_t opacity_to_byte(float alpha)
{
    if (!(alpha > 0.0f))   // also catches NaN
        return 0;
    if (alpha >= 1.0f)
        return 255;
    return static_cast<uint8_t>(std::lround(alpha * 255.0f));
}

Frame composite_rgba(const Frame& color, const MaskFrame* mask)
{
    if (color.channels != 3 || !color.is_valid())
        throw FrameError("cannot composite alpha onto a " + std::to_string(color.channels)
                         + "-channel frame");

    if (mask
        && (mask->width != color.width || mask->height != color.height
            || mask->alpha.size() != mask->pixel_count()))
        throw FrameError("mask is " + geometry(mask->width, mask->height) + " but frame is "
                         + geometry(color.width, color.height));

    Frame out(color.width, color.height, 4);

    const size_t   pixels = color.pixel_count();
    const uint8_t* src    = color.pixels.data();
    uint8_t*       dst    = out.pixels.data();
    for (size_t i = 0; i < pixels; ++i)
    {
        dst[i * 4 + 0] = src[i * 3 + 0];
        dst[i * 4 + 1] = src[i * 3 + 1];
        dst[i * 4 + 2] = src[i * 3 + 2];
        dst[i * 4 + 3] = mask ? opacity_to_byte(mask->alpha[i]) : 255;
    }
    return out;
}

Frame strip_alpha(const Frame& rgba)
{
    Frame out(rgba.width, rgba.height, 3);

    const size_t pixels = rgba.pixel_count();
    for (size_t i = 0; i < pixels; ++i)
    {
        out.pixels[i * 3 + 0] = rgba.pixels[i * 4 + 0];
        out.pixels[i * 3 + 1] = rgba.pixels[i * 4 + 1];
        out.pixels[i * 3 + 2] = rgba.pixels[i * 4 + 2];
    }
    return out;
}

Frame prepare_frame(Frame&&          frame,
                    const MaskFrame* mask,
                    bool             with_alpha,
                    uint32_t         width,
                    uint32_t         height)
{
    if (frame.width != width || frame.height != height)
        throw FrameError("frame is " + geometry(frame.width, frame.height) + " but clip is "
                         + geometry(width, height));

    if ((frame.channels != 3 && frame.channels != 4) || !frame.is_valid())
        throw FrameError("frame buffer holds " + std::to_string(frame.pixels.size())
                         + " bytes for " + geometry(width, height) + "x"
                         + std::to_string(frame.channels));

    if (with_alpha)
    {
        if (frame.channels == 4)
            return std::move(frame);
        return composite_rgba(frame, mask);
    }

    if (frame.channels == 4)
        return strip_alpha(frame);
    return std::move(frame);
}

}   // namespace gifpipe
