#include "pool_cpp/config.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string_view>

namespace pool_cpp {

    namespace {

        std::string_view trim(std::string_view s) {
            const auto first = s.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) return {};
            const auto last = s.find_last_not_of(" \t\r\n");
            return s.substr(first, last - first + 1);
        }

        bool ends_with(std::string_view s, std::string_view suffix) {
            return s.size() >= suffix.size() &&
                   s.substr(s.size() - suffix.size()) == suffix;
        }

        Error invalid(std::string message) {
            return Error{Error::Code::InvalidConfiguration, std::move(message)};
        }

        Result<std::size_t> parse_size(const std::string& text) {
            const std::string_view s = trim(text);
            std::size_t value = 0;
            const auto* end = s.data() + s.size();
            auto [ptr, ec] = std::from_chars(s.data(), end, value);
            if (s.empty() || ec != std::errc{} || ptr != end) {
                return Result<std::size_t>::err(
                    invalid("size must be a positive integer, got '" + text +
                            "'"));
            }
            return Result<std::size_t>::ok(value);
        }

    }  // namespace

    Result<std::chrono::milliseconds> parse_timeout(const std::string& text) {
        using R = Result<std::chrono::milliseconds>;

        std::string_view s = trim(text);
        double scale = 1000.0;  // bare numbers are seconds
        if (ends_with(s, "ms")) {
            scale = 1.0;
            s.remove_suffix(2);
        } else if (ends_with(s, "s")) {
            s.remove_suffix(1);
        }
        s = trim(s);

        // strtod needs a terminated buffer
        const std::string number(s);
        char* end = nullptr;
        const double value = std::strtod(number.c_str(), &end);

        if (number.empty() || end != number.c_str() + number.size() ||
            !std::isfinite(value)) {
            return R::err(invalid("timeout must be a duration such as "
                                  "'5', '0.5', '250ms' or '2s', got '" +
                                  text + "'"));
        }
        if (value < 0) {
            return R::err(
                invalid("timeout must not be negative, got '" + text + "'"));
        }
        // milliseconds::max() rounds up to 2^63, which llround() cannot return
        if (value * scale >=
            static_cast<double>(std::chrono::milliseconds::max().count())) {
            return R::err(invalid("timeout too large, got '" + text + "'"));
        }

        return R::ok(std::chrono::milliseconds(
            static_cast<std::chrono::milliseconds::rep>(std::llround(value * scale))));
    }

    Result<PoolConfiguration> validate(PoolConfiguration config) {
        if (config.size == 0) {
            return Result<PoolConfiguration>::err(
                invalid("size must be a positive integer"));
        }
        if (config.timeout.count() < 0) {
            return Result<PoolConfiguration>::err(
                invalid("timeout must not be negative"));
        }
        return Result<PoolConfiguration>::ok(std::move(config));
    }

    Result<PoolConfiguration> PoolConfiguration::from_options(
        const std::map<std::string, std::string>& options,
        PoolConfiguration base) {
        for (auto const& [key, value] : options) {
            if (key == "size") {
                auto size = parse_size(value);
                if (size.has_error()) {
                    return Result<PoolConfiguration>::err(
                        std::move(size).error());
                }
                base.size = size.value();
            } else if (key == "timeout") {
                auto timeout = parse_timeout(value);
                if (timeout.has_error()) {
                    return Result<PoolConfiguration>::err(
                        std::move(timeout).error());
                }
                base.timeout = timeout.value();
            } else {
                return Result<PoolConfiguration>::err(
                    invalid("unknown pool option '" + key + "'"));
            }
        }
        return validate(std::move(base));
    }

    Result<PoolConfiguration> PoolConfiguration::from_options(
        const std::map<std::string, std::string>& options) {
        return from_options(options, PoolConfiguration{});
    }

}  // namespace pool_cpp
