#pragma once

// gifpipe — Stream in-memory frames into animated GIFs through ffmpeg and
// ImageMagick pipelines.

#include <gifpipe/encoder_plan.hpp>
#include <gifpipe/errors.hpp>
#include <gifpipe/frame_source.hpp>
#include <gifpipe/gif_options.hpp>
#include <gifpipe/gif_writer.hpp>
#include <gifpipe/logger.hpp>
#include <gifpipe/settings.hpp>
