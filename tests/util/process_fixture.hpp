#pragma once

// Helpers for tests that launch encoder processes.
//
// Usage:
//   gifpipe::test::TempDir dir("pipeline");
//   auto path = dir.file("out.bin");
//   ... run a pipeline ...
//   EXPECT_TRUE(gifpipe::test::no_child_processes());

#include <gtest/gtest.h>

#include <cerrno>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace gifpipe::test
{

// True when this process has no child left, running or zombie.
// A zombie found here is reaped so it does not leak into later tests.
inline bool no_child_processes()
{
    int   status = 0;
    pid_t r      = ::waitpid(-1, &status, WNOHANG);
    if (r > 0)
    {
        while (::waitpid(-1, &status, WNOHANG) > 0)
        {
        }
        return false;
    }
    return r == -1 && errno == ECHILD;
}

inline std::vector<uint8_t> read_file(const std::filesystem::path& path)
{
    std::ifstream f(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(f)),
                                std::istreambuf_iterator<char>());
}

// Fresh directory under the system temp dir, removed on destruction.
class TempDir
{
   public:
    explicit TempDir(const std::string& tag)
    {
        path_ = std::filesystem::temp_directory_path()
                / ("gifpipe_test_" + tag + "_" + std::to_string(::getpid()));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&)            = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

   private:
    std::filesystem::path path_;
};

}   // namespace gifpipe::test
