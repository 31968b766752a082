#include "pool_cpp/error.hpp"

#include <string>

namespace pool_cpp {

    const char* to_string(Error::Code code) noexcept {
        switch (code) {
            case Error::Code::InvalidConfiguration:
                return "InvalidConfiguration";
            case Error::Code::Timeout:
                return "Timeout";
            case Error::Code::Shutdown:
                return "Shutdown";
            case Error::Code::NotCheckedOut:
                return "NotCheckedOut";
            case Error::Code::Unknown:
                return "Unknown";
        }
        return "Unknown";
    }

    PoolError::PoolError(Error error)
        : std::runtime_error(std::string(to_string(error.code)) + ": " +
                             error.message),
          m_error(std::move(error)) {}

}  // namespace pool_cpp
