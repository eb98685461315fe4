//
// Created by the packrat authors on 18/10/26.
//

#include "../../include/options.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"

namespace packrat {

void Options::validate() const {
    if (buffer_size_ == 0) {
        Logger::log(LogLevel::Error, "Invalid buffer size: 0", "Options");
        throw ConfigurationError("Buffer size must be a positive number of bytes");
    }
}

} // namespace packrat
