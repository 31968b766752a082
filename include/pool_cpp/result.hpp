#pragma once

#include <cassert>
#include <type_traits>
#include <utility>
#include <variant>

#include "error.hpp"

namespace pool_cpp {

    /// @brief Result<T> holds either a successful value of type T or an
    /// Error.
    /// @tparam T The type of the successful value. May be move-only (a
    /// Pool::Lease is).
    /// @note Same idea as std::expected<T, Error> from C++23. Pool operations
    /// that can fail for ordinary reasons (timeout, shutdown, bad options)
    /// return one of these instead of throwing.
    template <typename T>
    class [[nodiscard]] Result {
       public:
        using value_type = T;

        /// @brief Create a successful Result with the given value.
        /// @tparam Args The types of the arguments to construct T.
        /// @param args The arguments to construct T.
        /// @return A Result containing the constructed T.
        template <typename... Args, typename = std::enable_if_t<
                                        std::is_constructible_v<T, Args&&...>>>
        static Result ok(Args&&... args) {
            return Result(std::in_place_type<T>, std::forward<Args>(args)...);
        }

        /// @brief Create an error Result with the given Error.
        static Result err(const Error& error) {
            return Result(std::in_place_type<Error>, error);
        }

        /// @brief Create an error Result with the given Error.
        static Result err(Error&& error) {
            return Result(std::in_place_type<Error>, std::move(error));
        }

        /// @brief Shorthand for err(Error{code, message}).
        static Result err(Error::Code code, std::string message) {
            return err(Error{code, std::move(message)});
        }

        /// @brief Allow `if (result) { ... }` to mean "if success".
        explicit operator bool() const noexcept { return has_value(); }

        /// @brief True if this Result currently holds a value of type T.
        bool has_value() const noexcept {
            return std::holds_alternative<T>(m_state);
        }

        /// @brief True if this Result currently holds an Error.
        bool has_error() const noexcept {
            return std::holds_alternative<Error>(m_state);
        }

        const T& value() const& {
            const T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return *p;
        }

        T& value() & {
            T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return *p;
        }

        T&& value() && {
            T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return std::move(*p);
        }

        /// @brief Move the value out, or throw PoolError with the stored
        /// Error.
        /// @note This is how the throwing entry points (Pool::with) turn a
        /// failed checkout into an exception.
        T value_or_throw() && {
            if (auto* e = error_ptr()) throw PoolError(std::move(*e));
            return std::move(*value_ptr());
        }

        [[nodiscard]] const T* value_ptr() const noexcept {
            return std::get_if<T>(&m_state);
        }

        [[nodiscard]] T* value_ptr() noexcept {
            return std::get_if<T>(&m_state);
        }

        const Error& error() const& {
            const Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return *p;
        }

        Error& error() & {
            Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return *p;
        }

        Error&& error() && {
            Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return std::move(*p);
        }

        [[nodiscard]] const Error* error_ptr() const noexcept {
            return std::get_if<Error>(&m_state);
        }

        [[nodiscard]] Error* error_ptr() noexcept {
            return std::get_if<Error>(&m_state);
        }

        /// @brief Return the stored value if present, otherwise call a
        /// fallback function.
        /// @note make_fallback() only runs when there is no value.
        template <typename F,
                  typename = std::enable_if_t<std::is_invocable_r_v<T, F&&>>>
        T value_or_else(F&& make_fallback) const& {
            return has_value() ? value() : std::forward<F>(make_fallback)();
        }

        template <typename F,
                  typename = std::enable_if_t<std::is_invocable_r_v<T, F&&>>>
        T value_or_else(F&& make_fallback) && {
            return has_value() ? std::move(*this).value()
                               : std::forward<F>(make_fallback)();
        }

        /// @brief Eager fallback: stored value if present, otherwise
        /// fallback.
        T value_or(T fallback) const& {
            return value_or_else([&] { return std::move(fallback); });
        }

        T value_or(T fallback) && {
            return std::move(*this).value_or_else(
                [&] { return std::move(fallback); });
        }

        /// @brief True if this Result holds an Error with the given code.
        bool is(Error::Code code) const noexcept {
            const Error* e = error_ptr();
            return e && e->code == code;
        }

       private:
        template <typename... Args>
        explicit Result(std::in_place_type_t<T>, Args&&... args)
            : m_state(std::in_place_type<T>, std::forward<Args>(args)...) {}

        explicit Result(std::in_place_type_t<Error>, const Error& error)
            : m_state(std::in_place_type<Error>, error) {}

        explicit Result(std::in_place_type_t<Error>, Error&& error)
            : m_state(std::in_place_type<Error>, std::move(error)) {}

        /// @brief Storage: exactly one of {T, Error} is active at any time.
        std::variant<T, Error> m_state;
    };

}  // namespace pool_cpp
