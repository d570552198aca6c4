#pragma once

#include "types/common_types.hpp"
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <cstdint>

namespace tsimport {
namespace importer {

// Character-level tokenizer for
//   measurement[,tag=value...] field=value[,field=value...] [timestamp]
//
// Escape (\), quote (") and bracket ([...] inside a tag value) are modifiers
// evaluated before the (state, character class) transition table.
class LineProtocolParser {
public:
    enum class State {
        MEASUREMENT,
        TAG_KEY,
        TAG_VALUE,
        FIELD_KEY,
        FIELD_VALUE,
        TIMESTAMP
    };

    enum class CharClass {
        BACKSLASH,
        QUOTE,
        COMMA,
        EQUALS,
        SPACE,
        OPEN_BRACKET,
        CLOSE_BRACKET,
        OTHER
    };

    // What the scanner does with one structural character
    enum class Step {
        APPEND,
        IGNORE,
        BEGIN_TAGS,
        NEXT_TAG,
        NEXT_FIELD,
        TAG_VALUE,
        FIELD_VALUE,
        BEGIN_FIELDS,
        BEGIN_TIMESTAMP,
        END_LINE,
        OPEN_BRACKET,
        CLOSE_BRACKET,
        INVALID_BRACKET
    };

    using PointCallback = std::function<void(types::Point&&)>;

    explicit LineProtocolParser(std::string raw);

    // Scans the whole text on every call. Blank lines and lines starting
    // with '#' are skipped. The first malformed line throws ParseError and
    // no points are returned.
    std::vector<types::Point> parse(int64_t time_multiplier = 1) const;

    // Streaming variant of parse(); points parsed before a failing line
    // have already been handed to the callback.
    size_t parse_each(const PointCallback& callback, int64_t time_multiplier = 1) const;

    // Single trimmed line; std::nullopt for comment lines
    static std::optional<types::Point> parse_line(const std::string& line, int64_t time_multiplier = 1);

    static CharClass classify(char c);
    static Step transition(State state, CharClass char_class, bool in_bracket);

private:
    std::string raw_;
};

} // namespace importer
} // namespace tsimport
