#pragma once

#include <cstdint>
#include <gifpipe/frame_source.hpp>

namespace gifpipe
{

// Maps an opacity in [0, 1] to round(alpha * 255). Out-of-range values
// are clamped.
uint8_t opacity_to_byte(float alpha);

// Interleaves mask as a fourth channel of an RGB frame. A null mask means
// fully opaque. Throws FrameError if the mask geometry differs from the
// frame's or the frame is not 3-channel.
Frame composite_rgba(const Frame& color, const MaskFrame* mask);

// Drops the alpha channel of an RGBA frame.
Frame strip_alpha(const Frame& rgba);

// Brings a source frame into the layout the first encoder stage expects:
// width x height, 4 channels when with_alpha else 3.
//
//   with_alpha, RGB frame  : mask interleaved as alpha
//   with_alpha, RGBA frame : passed through
//   !with_alpha, RGB frame : passed through
//   !with_alpha, RGBA frame: alpha dropped
//
// Throws FrameError on size mismatch or an unsupported channel count.
Frame prepare_frame(Frame&&          frame,
                    const MaskFrame* mask,
                    bool             with_alpha,
                    uint32_t         width,
                    uint32_t         height);

}   // namespace gifpipe
