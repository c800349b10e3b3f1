#include "nl_command/command/param_value.h"

#include <charconv>
#include <stdexcept>

namespace nl_command {

ParamValue::ParamValue(std::string raw_value)
    : raw_value_(std::move(raw_value)) {}

ParamValue::ParamValue(int value)
    : raw_value_(std::to_string(value)) {}

const std::string& ParamValue::AsString() const {
    return raw_value_;
}

std::optional<int> ParamValue::TryAsInt() const {
    const char* first = raw_value_.data();
    const char* last = first + raw_value_.size();

    int value = 0;
    auto [end, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || end != last || first == last) {
        return std::nullopt;
    }
    return value;
}

int ParamValue::AsInt() const {
    if (auto value = TryAsInt()) {
        return *value;
    }
    throw std::invalid_argument("Not an integer parameter value: '" + raw_value_ + "'");
}

bool ParamValue::IsEmpty() const {
    return raw_value_.empty();
}

}  // namespace nl_command
