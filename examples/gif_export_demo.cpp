#include <cmath>
#include <cstdlib>
#include <gifpipe/gifpipe.hpp>
#include <iostream>
#include <string>
#include <utility>

using namespace gifpipe;

// Renders a bouncing disc over a moving gradient and writes it as a GIF.
//
//   gifpipe_demo [output.gif] [ffmpeg|ImageMagick|giflib] [none|OptimizePlus|OptimizeTransparency]
int main(int argc, char** argv)
{
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    std::string output  = argc > 1 ? argv[1] : "gifpipe_demo.gif";
    std::string backend = argc > 2 ? argv[2] : "ImageMagick";
    std::string opt     = argc > 3 ? argv[3] : "OptimizeTransparency";

    constexpr uint32_t W = 160;
    constexpr uint32_t H = 120;

    auto disc_center = [](double t)
    {
        double x = W * (0.5 + 0.35 * std::sin(t * 3.0));
        double y = H * (0.5 + 0.35 * std::abs(std::cos(t * 4.0)));
        return std::pair<double, double>(x, y);
    };

    CallbackClip clip(W,
                      H,
                      15.0,
                      3.0,
                      [&](double t)
                      {
                          Frame f(W, H, 3);
                          auto [cx, cy] = disc_center(t);
                          for (uint32_t y = 0; y < H; ++y)
                          {
                              for (uint32_t x = 0; x < W; ++x)
                              {
                                  size_t idx = (static_cast<size_t>(y) * W + x) * 3;
                                  double dx  = x - cx;
                                  double dy  = y - cy;
                                  bool   in  = dx * dx + dy * dy < 400.0;
                                  f.pixels[idx + 0] = in ? 250 : static_cast<uint8_t>((x * 255) / W);
                                  f.pixels[idx + 1] = in ? 200 : static_cast<uint8_t>((y * 255) / H);
                                  f.pixels[idx + 2] =
                                      in ? 40 : static_cast<uint8_t>(static_cast<int>(t * 80.0) % 256);
                              }
                          }
                          return f;
                      });

    // Everything outside a circle around the disc is transparent.
    clip.set_mask(
        [&](double t)
        {
            MaskFrame m(W, H, 0.0f);
            auto [cx, cy] = disc_center(t);
            for (uint32_t y = 0; y < H; ++y)
            {
                for (uint32_t x = 0; x < W; ++x)
                {
                    double d2 = (x - cx) * (x - cx) + (y - cy) * (y - cy);
                    m.alpha[static_cast<size_t>(y) * W + x] = d2 < 1600.0 ? 1.0f : 0.0f;
                }
            }
            return m;
        });

    GifOptions options;
    options.output_path = output;
    options.loop        = 0;
    options.colors      = 64;

    auto on_progress = [](uint32_t done, uint32_t total)
    {
        if (done == total || done % 10 == 0)
            std::cout << "frame " << done << "/" << total << "\n";
    };

    try
    {
        ExportReport report;
        if (backend == "giflib")
        {
            report = write_gif_with_giflib(clip, options, on_progress);
        }
        else
        {
            options.program  = parse_program(backend);
            options.optimize = parse_optimize(opt);
            report           = write_gif(clip, options, on_progress);
        }
        std::cout << "Wrote " << report.output_path << " (" << report.frames_written
                  << " frames, " << report.stage_count << " encoder stage(s))\n";
    }
    catch (const Error& e)
    {
        GIFPIPE_LOG_ERROR("demo", "{}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
