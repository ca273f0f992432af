#include <gifpipe/errors.hpp>
#include <gifpipe/gif_writer.hpp>
#include <gifpipe/logger.hpp>

#ifdef GIFPIPE_USE_GIFLIB

    #include <gif_lib.h>

    #include <cmath>
    #include <memory>
    #include <string>
    #include <vector>

    #include "pixel_compositor.hpp"

namespace gifpipe
{

namespace
{

struct GifFileCloser
{
    void operator()(GifFileType* gif) const
    {
        int error = 0;
        EGifCloseFile(gif, &error);
    }
};

struct ColorMapDeleter
{
    void operator()(ColorMapObject* map) const { GifFreeMapObject(map); }
};

using GifFilePtr  = std::unique_ptr<GifFileType, GifFileCloser>;
using ColorMapPtr = std::unique_ptr<ColorMapObject, ColorMapDeleter>;

std::string gif_error(int code)
{
    const char* msg = GifErrorString(code);
    return msg ? msg : "giflib error " + std::to_string(code);
}

// GIF color tables hold a power-of-two number of entries.
int color_table_size(int colors)
{
    int size = 2;
    while (size < colors)
        size <<= 1;
    return size;
}

// NETSCAPE2.0 application extension; 0 loops forever.
void put_loop_extension(GifFileType* gif, int loop, const std::string& destination)
{
    static const char app_id[] = "NETSCAPE2.0";
    const GifByteType sub_block[3] = {
        1,
        static_cast<GifByteType>(loop & 0xff),
        static_cast<GifByteType>((loop >> 8) & 0xff),
    };

    if (EGifPutExtensionLeader(gif, APPLICATION_EXT_FUNC_CODE) == GIF_ERROR
        || EGifPutExtensionBlock(gif, 11, app_id) == GIF_ERROR
        || EGifPutExtensionBlock(gif, 3, sub_block) == GIF_ERROR
        || EGifPutExtensionTrailer(gif) == GIF_ERROR)
        throw StreamWriteError(destination, gif_error(gif->Error));
}

void put_frame(GifFileType*                gif,
               const Frame&                rgb,
               int                         colors,
               const GraphicsControlBlock& gcb,
               const std::string&          destination)
{
    const size_t pixels = rgb.pixel_count();

    std::vector<GifByteType> red(pixels), green(pixels), blue(pixels), indexed(pixels);
    for (size_t i = 0; i < pixels; ++i)
    {
        red[i]   = rgb.pixels[i * 3 + 0];
        green[i] = rgb.pixels[i * 3 + 1];
        blue[i]  = rgb.pixels[i * 3 + 2];
    }

    const int                 table_size = color_table_size(colors);
    std::vector<GifColorType> palette(static_cast<size_t>(table_size), GifColorType{0, 0, 0});

    int palette_size = colors;
    if (GifQuantizeBuffer(rgb.width,
                          rgb.height,
                          &palette_size,
                          red.data(),
                          green.data(),
                          blue.data(),
                          indexed.data(),
                          palette.data())
        == GIF_ERROR)
        throw StreamWriteError(destination, "palette quantization failed");

    ColorMapPtr color_map(GifMakeMapObject(table_size, palette.data()));
    if (!color_map)
        throw StreamWriteError(destination, "could not allocate color map");

    GifByteType extension[4];
    EGifGCBToExtension(&gcb, extension);
    if (EGifPutExtension(gif, GRAPHICS_EXT_FUNC_CODE, 4, extension) == GIF_ERROR)
        throw StreamWriteError(destination, gif_error(gif->Error));

    const int width  = static_cast<int>(rgb.width);
    const int height = static_cast<int>(rgb.height);
    if (EGifPutImageDesc(gif, 0, 0, width, height, false, color_map.get()) == GIF_ERROR)
        throw StreamWriteError(destination, gif_error(gif->Error));

    for (int y = 0; y < height; ++y)
    {
        GifByteType* row = indexed.data() + static_cast<size_t>(y) * rgb.width;
        if (EGifPutLine(gif, row, width) == GIF_ERROR)
            throw StreamWriteError(destination, gif_error(gif->Error));
    }
}

}   // namespace

bool has_giflib_backend()
{
    return true;
}

ExportReport write_gif_with_giflib(const FrameSource&      clip,
                                   const GifOptions&       options,
                                   const ProgressCallback& progress)
{
    validate_options(clip, options);

    const double   fps         = options.fps > 0.0 ? options.fps : clip.fps();
    const uint32_t width       = clip.width();
    const uint32_t height      = clip.height();
    const int      colors      = static_cast<int>(options.colors.value_or(256));
    const auto&    destination = options.output_path;

    GIFPIPE_LOG_INFO("giflib", "Building file {} with giflib ({} colors)", destination, colors);

    int        error = 0;
    GifFilePtr gif(EGifOpenFileName(destination.c_str(), false, &error));
    if (!gif)
        throw StreamWriteError(destination, gif_error(error));

    EGifSetGifVersion(gif.get(), true);
    if (EGifPutScreenDesc(gif.get(),
                          static_cast<int>(width),
                          static_cast<int>(height),
                          8,
                          0,
                          nullptr)
        == GIF_ERROR)
        throw StreamWriteError(destination, gif_error(gif->Error));

    put_loop_extension(gif.get(), options.loop, destination);

    GraphicsControlBlock gcb;
    gcb.DisposalMode     = options.disposal == Disposal::RestoreBackground ? DISPOSE_BACKGROUND
                                                                           : DISPOSE_DO_NOT;
    gcb.UserInputFlag    = false;
    gcb.DelayTime        = static_cast<int>(std::lround(100.0 / fps));
    gcb.TransparentColor = NO_TRANSPARENT_COLOR;

    ExportReport report;
    report.output_path  = destination;
    report.frames_total = total_frame_count(clip.duration(), fps);

    clip.iterate_frames(fps,
                        [&](double /*t*/, Frame&& frame)
                        {
                            Frame rgb = prepare_frame(std::move(frame), nullptr, false, width, height);
                            put_frame(gif.get(), rgb, colors, gcb, destination);

                            ++report.frames_written;
                            if (progress)
                                progress(report.frames_written, report.frames_total);
                        });

    GifFileType* raw = gif.release();
    if (EGifCloseFile(raw, &error) == GIF_ERROR)
        throw StreamWriteError(destination, gif_error(error));

    GIFPIPE_LOG_INFO("giflib", "File {} is ready", destination);
    return report;
}

}   // namespace gifpipe

#else   // !GIFPIPE_USE_GIFLIB

namespace gifpipe
{

bool has_giflib_backend()
{
    return false;
}

ExportReport write_gif_with_giflib(const FrameSource& /*clip*/,
                                   const GifOptions& /*options*/,
                                   const ProgressCallback& /*progress*/)
{
    GIFPIPE_LOG_ERROR("giflib", "giflib backend requested but not built");
    throw MissingDependencyError(
        "writing a GIF with giflib requires GIFPIPE_USE_GIFLIB (rebuild with giflib installed)");
}

}   // namespace gifpipe

#endif   // GIFPIPE_USE_GIFLIB
