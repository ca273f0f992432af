#pragma once

#include <stdexcept>
#include <string>

namespace gifpipe
{

// Base class for every failure raised by an export call.
class Error : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

// An encoder binary could not be started (missing executable, permissions).
class LaunchError : public Error
{
   public:
    LaunchError(const std::string& program, const std::string& reason, const std::string& hint);

    const std::string& program() const { return program_; }

   private:
    std::string program_;
};

// Writing frame bytes into the pipeline failed, typically because a
// downstream encoder already exited.
class StreamWriteError : public Error
{
   public:
    StreamWriteError(const std::string& destination, const std::string& cause);

    const std::string& destination() const { return destination_; }
    const std::string& cause() const { return cause_; }

   private:
    std::string destination_;
    std::string cause_;
};

// Invalid option combination or encoder plan. Raised before any process
// is launched.
class ConfigurationError : public Error
{
   public:
    using Error::Error;
};

// An optional backend was not compiled into this build.
class MissingDependencyError : public Error
{
   public:
    using Error::Error;
};

// A frame or mask produced by the source does not match the clip geometry.
class FrameError : public Error
{
   public:
    using Error::Error;
};

}   // namespace gifpipe
