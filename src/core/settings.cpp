#include <cstdlib>
#include <filesystem>
#include <gifpipe/gif_options.hpp>
#include <gifpipe/settings.hpp>
#include <sstream>
#include <unistd.h>

namespace gifpipe
{

static std::string pick_binary(const std::string& explicit_value,
                               const char*        env_name,
                               const std::string& fallback)
{
    if (!explicit_value.empty())
        return explicit_value;

    const char* env = std::getenv(env_name);
    if (env && env[0] != '\0')
        return env;

    return fallback;
}

EncoderBinaries resolve_binaries(const GifOptions& options)
{
    EncoderBinaries defaults;
    EncoderBinaries result;
    result.ffmpeg = pick_binary(options.ffmpeg_binary, FFMPEG_BINARY_ENV, defaults.ffmpeg);
    result.imagemagick =
        pick_binary(options.imagemagick_binary, IMAGEMAGICK_BINARY_ENV, defaults.imagemagick);
    return result;
}

std::string find_program(const std::string& name)
{
    if (name.empty())
        return {};

    if (name.find('/') != std::string::npos)
        return ::access(name.c_str(), X_OK) == 0 ? name : std::string();

    const char* path_env = std::getenv("PATH");
    if (!path_env)
        return {};

    std::istringstream dirs(path_env);
    std::string        dir;
    while (std::getline(dirs, dir, ':'))
    {
        if (dir.empty())
            dir = ".";
        std::filesystem::path candidate = std::filesystem::path(dir) / name;

        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec)
            && ::access(candidate.c_str(), X_OK) == 0)
            return candidate.string();
    }
    return {};
}

}   // namespace gifpipe
