#ifndef NL_COMMAND_COMMAND_PARAM_VALUE_H
#define NL_COMMAND_COMMAND_PARAM_VALUE_H

// Typed view over a parameter value extracted from an utterance.

#include <optional>
#include <string>

namespace nl_command {

// Represents a single parameter value extracted from text.
// Internally stored as string, with typed accessors.
class ParamValue {
public:
    ParamValue() = default;
    explicit ParamValue(std::string raw_value);
    explicit ParamValue(int value);

    // Returns the raw string value.
    const std::string& AsString() const;

    // Converts to int. Throws std::invalid_argument if conversion fails.
    int AsInt() const;

    // Non-throwing AsInt(). Nullopt unless the whole value is a decimal
    // integer that fits in an int.
    std::optional<int> TryAsInt() const;

    // Returns true if the value is empty.
    bool IsEmpty() const;

    bool operator==(const ParamValue& other) const {
        return raw_value_ == other.raw_value_;
    }
    bool operator!=(const ParamValue& other) const { return !(*this == other); }

private:
    std::string raw_value_;
};

}  // namespace nl_command

#endif  // NL_COMMAND_COMMAND_PARAM_VALUE_H
