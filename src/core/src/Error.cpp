/**
 * @file Error.cpp
 * @brief Implementation of Error::format().
 * @author MasterLaplace
 */

#include "mts/core/Error.hpp"

#include <sstream>

namespace mts::core {

std::string Error::format() const
{
    std::ostringstream os;
    os << '[' << errorCodeName(_code) << "] " << _message
       << " (" << _location.file_name() << ':' << _location.line() << ')';
    return os.str();
}

} // namespace mts::core
