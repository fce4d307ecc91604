#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace TS {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        MalformedInput, // not JSON, wrong JSON type, unreadable payload
        InvalidToken,   // unknown palette token
        InvalidColor,   // value is not a #RGB, #RRGGBB or rgb()/rgba() color
        InvalidOption,  // unknown option key or enum name
        NotFound,
        NotSupported
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    auto operator==(Error const&) const -> bool = default;

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto fail(Error::Code code, std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{code, std::move(message)});
}

// snake_case label such as "invalid_color"; out-of-range codes give "unknown_error".
[[nodiscard]] auto errorCodeToString(Error::Code code) -> std::string_view;

// "label:message", or the bare label when there is no message.
[[nodiscard]] auto describeError(Error const& error) -> std::string;

} // namespace TS
