#include <tonestyle/core/Error.hpp>

#include <array>
#include <utility>

namespace TS {

namespace {

constexpr std::array<std::pair<Error::Code, std::string_view>, 8> kCodeLabels{{
    {Error::Code::InvalidError, "invalid_error"},
    {Error::Code::UnknownError, "unknown_error"},
    {Error::Code::MalformedInput, "malformed_input"},
    {Error::Code::InvalidToken, "invalid_token"},
    {Error::Code::InvalidColor, "invalid_color"},
    {Error::Code::InvalidOption, "invalid_option"},
    {Error::Code::NotFound, "not_found"},
    {Error::Code::NotSupported, "not_supported"},
}};

} // namespace

auto errorCodeToString(Error::Code code) -> std::string_view {
    for (auto const& [value, label] : kCodeLabels) {
        if (value == code) {
            return label;
        }
    }
    return "unknown_error";
}

auto describeError(Error const& error) -> std::string {
    std::string description{errorCodeToString(error.code)};
    if (error.message && !error.message->empty()) {
        description.push_back(':');
        description += *error.message;
    }
    return description;
}

} // namespace TS
