#include "errors.hpp"

#include <cerrno>
#include <cstring>

namespace gate {

LaunchError::LaunchError(const std::string& executable, int error_number)
    : std::runtime_error("cannot execute " + executable + ": " + std::strerror(error_number))
    , errno_(error_number)
{
}

int LaunchError::exit_code() const {
    return errno_ == ENOENT ? exit_code::NOT_FOUND : exit_code::NOT_EXECUTABLE;
}

} // namespace gate
