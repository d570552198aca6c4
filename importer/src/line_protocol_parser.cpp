#include "line_protocol_parser.hpp"
#include "value_coercion.hpp"
#include "core/exceptions.hpp"
#include <sstream>
#include <charconv>
#include <chrono>

namespace tsimport {
namespace importer {

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

using State = LineProtocolParser::State;
using CharClass = LineProtocolParser::CharClass;
using Step = LineProtocolParser::Step;

// Per-line scanning state
class LineScanner {
public:
    explicit LineScanner(int64_t time_multiplier) : time_multiplier_(time_multiplier) {}

    types::Point scan(const std::string& line) {
        for (char c : line) {
            if (done_) {
                break;
            }
            feed(c);
        }
        if (quoted_) {
            throw ParseError("unterminated quoted string in line: " + line);
        }
        finish();
        return std::move(point_);
    }

private:
    void feed(char c) {
        if (escaped_) {
            append(c);
            escaped_ = false;
            return;
        }

        CharClass cls = LineProtocolParser::classify(c);
        if (cls == CharClass::BACKSLASH) {
            escaped_ = true;
            return;
        }
        if (cls == CharClass::QUOTE) {
            quoted_ = !quoted_;
            if (state_ == State::FIELD_VALUE) {
                value_quoted_ = true;
            }
            return;
        }
        if (quoted_) {
            append(c);
            return;
        }

        switch (LineProtocolParser::transition(state_, cls, in_bracket_)) {
            case Step::APPEND:
                append(c);
                break;
            case Step::IGNORE:
                break;
            case Step::BEGIN_TAGS:
                state_ = State::TAG_KEY;
                break;
            case Step::NEXT_TAG:
                flush_pair();
                state_ = State::TAG_KEY;
                break;
            case Step::NEXT_FIELD:
                flush_pair();
                state_ = State::FIELD_KEY;
                break;
            case Step::TAG_VALUE:
                state_ = State::TAG_VALUE;
                break;
            case Step::FIELD_VALUE:
                state_ = State::FIELD_VALUE;
                break;
            case Step::BEGIN_FIELDS:
                flush_pair();
                state_ = State::FIELD_KEY;
                break;
            case Step::BEGIN_TIMESTAMP:
                flush_pair();
                state_ = State::TIMESTAMP;
                break;
            case Step::END_LINE:
                done_ = true;
                break;
            case Step::OPEN_BRACKET:
                in_bracket_ = true;
                append(c);
                break;
            case Step::CLOSE_BRACKET:
                in_bracket_ = false;
                append(c);
                break;
            case Step::INVALID_BRACKET:
                throw ParseError(std::string("invalid tag value token: '") + c + "'");
        }
    }

    void append(char c) {
        switch (state_) {
            case State::MEASUREMENT: point_.measurement.push_back(c); break;
            case State::TAG_KEY:
            case State::FIELD_KEY: key_.push_back(c); break;
            case State::TAG_VALUE:
            case State::FIELD_VALUE: value_.push_back(c); break;
            case State::TIMESTAMP: timestamp_.push_back(c); break;
        }
    }

    // Stores the pending key/value pair as a tag or field depending on the state
    void flush_pair() {
        if (!key_.empty()) {
            if (state_ == State::TAG_KEY || state_ == State::TAG_VALUE) {
                point_.add_tag(key_, value_);
            } else if (state_ == State::FIELD_KEY || state_ == State::FIELD_VALUE) {
                point_.add_field(key_, infer_field_value(value_, value_quoted_));
            }
        }
        key_.clear();
        value_.clear();
        value_quoted_ = false;
        in_bracket_ = false;
    }

    void finish() {
        if (state_ != State::TIMESTAMP) {
            flush_pair();
        }
        if (point_.measurement.empty()) {
            throw ParseError("missing measurement");
        }
        if (!point_.has_fields()) {
            throw ParseError("no fields input");
        }
        if (!timestamp_.empty()) {
            int64_t value = 0;
            const char* first = timestamp_.data();
            const char* last = timestamp_.data() + timestamp_.size();
            auto result = std::from_chars(first, last, value);
            if (result.ec != std::errc() || result.ptr != last) {
                throw ParseError("invalid timestamp: " + timestamp_);
            }
            auto scaled = scale_timestamp(value, time_multiplier_);
            if (!scaled) {
                throw ParseError("invalid timestamp: " + timestamp_);
            }
            point_.set_timestamp(*scaled);
        } else {
            point_.set_timestamp(std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count());
        }
    }

    int64_t time_multiplier_;
    State state_ = State::MEASUREMENT;
    bool escaped_ = false;
    bool quoted_ = false;
    bool value_quoted_ = false;
    bool in_bracket_ = false;
    bool done_ = false;

    types::Point point_;
    std::string key_;
    std::string value_;
    std::string timestamp_;
};

} // namespace

LineProtocolParser::LineProtocolParser(std::string raw) : raw_(std::move(raw)) {}

LineProtocolParser::CharClass LineProtocolParser::classify(char c) {
    switch (c) {
        case '\\': return CharClass::BACKSLASH;
        case '"': return CharClass::QUOTE;
        case ',': return CharClass::COMMA;
        case '=': return CharClass::EQUALS;
        case ' ': return CharClass::SPACE;
        case '[': return CharClass::OPEN_BRACKET;
        case ']': return CharClass::CLOSE_BRACKET;
        default: return CharClass::OTHER;
    }
}

LineProtocolParser::Step LineProtocolParser::transition(State state, CharClass char_class, bool in_bracket) {
    switch (char_class) {
        case CharClass::COMMA:
            switch (state) {
                case State::MEASUREMENT: return Step::BEGIN_TAGS;
                case State::TAG_VALUE: return in_bracket ? Step::APPEND : Step::NEXT_TAG;
                case State::FIELD_VALUE: return Step::NEXT_FIELD;
                default: return Step::IGNORE;
            }
        case CharClass::EQUALS:
            switch (state) {
                case State::TAG_KEY: return Step::TAG_VALUE;
                case State::FIELD_KEY: return Step::FIELD_VALUE;
                default: return Step::APPEND;
            }
        case CharClass::SPACE:
            switch (state) {
                case State::MEASUREMENT:
                case State::TAG_KEY:
                case State::TAG_VALUE: return Step::BEGIN_FIELDS;
                case State::FIELD_KEY:
                case State::FIELD_VALUE: return Step::BEGIN_TIMESTAMP;
                case State::TIMESTAMP: return Step::END_LINE;
            }
            return Step::IGNORE;
        case CharClass::OPEN_BRACKET:
            return state == State::TAG_VALUE ? Step::OPEN_BRACKET : Step::INVALID_BRACKET;
        case CharClass::CLOSE_BRACKET:
            return state == State::TAG_VALUE ? Step::CLOSE_BRACKET : Step::INVALID_BRACKET;
        default:
            return Step::APPEND;
    }
}

std::optional<types::Point> LineProtocolParser::parse_line(const std::string& line, int64_t time_multiplier) {
    std::string trimmed = trim(line);
    if (trimmed.empty() || trimmed[0] == '#') {
        return std::nullopt;
    }
    LineScanner scanner(time_multiplier);
    return scanner.scan(trimmed);
}

size_t LineProtocolParser::parse_each(const PointCallback& callback, int64_t time_multiplier) const {
    std::istringstream stream(raw_);
    std::string line;
    size_t count = 0;
    while (std::getline(stream, line)) {
        auto point = parse_line(line, time_multiplier);
        if (!point) {
            continue;
        }
        callback(std::move(*point));
        ++count;
    }
    return count;
}

std::vector<types::Point> LineProtocolParser::parse(int64_t time_multiplier) const {
    std::vector<types::Point> points;
    parse_each([&points](types::Point&& point) { points.push_back(std::move(point)); }, time_multiplier);
    return points;
}

} // namespace importer
} // namespace tsimport
