#pragma once
#include <stdexcept>
#include <string>

namespace pool_cpp {
    /**
     * @brief Represents an error raised by a pool operation.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            InvalidConfiguration, /**< Bad size/timeout, missing factory or unknown option. */
            Timeout,              /**< No resource became available in time. */
            Shutdown,             /**< The pool was shut down. */
            NotCheckedOut,        /**< checkin() without a matching checkout(). */
            Unknown,              /**< An unknown error occurred. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
    };

    /// @brief Convert an error code to a string for logging or diagnostics
    const char* to_string(Error::Code code) noexcept;

    /**
     * @brief Exception carrying an Error, used on the paths that cannot
     * return a Result (constructors, with(), checkin()).
     */
    class PoolError : public std::runtime_error {
       public:
        explicit PoolError(Error error);

        /** @brief The error that caused this exception. */
        [[nodiscard]] const Error& error() const noexcept { return m_error; }

        /** @brief Shortcut for error().code */
        [[nodiscard]] Error::Code code() const noexcept { return m_error.code; }

       private:
        Error m_error;
    };
}  // namespace pool_cpp
