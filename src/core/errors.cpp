#include <gifpipe/errors.hpp>

namespace gifpipe
{

LaunchError::LaunchError(const std::string& program,
                         const std::string& reason,
                         const std::string& hint)
    : Error("failed to start encoder '" + program + "': " + reason
            + (hint.empty() ? std::string() : ". " + hint)),
      program_(program)
{
}

StreamWriteError::StreamWriteError(const std::string& destination, const std::string& cause)
    : Error("creation of " + destination + " failed because of the following error: " + cause),
      destination_(destination),
      cause_(cause)
{
}

}   // namespace gifpipe
