#include "ocl_gaiasync/simple_json.h"
#include "ocl_gaiasync/types.h"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace ocl {
namespace gaiasync {

namespace {

class Scanner {
public:
    explicit Scanner(const std::string& text) : text_(text), pos_(0) {}

    void skipWhitespace() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool atEnd() const { return pos_ >= text_.size(); }

    char peek() const { return atEnd() ? '\0' : text_[pos_]; }

    void expect(char c) {
        skipWhitespace();
        if (peek() != c) {
            fail(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    std::string readString() {
        expect('"');
        std::string result;
        while (!atEnd()) {
            char c = text_[pos_++];
            if (c == '"') {
                return result;
            }
            if (c != '\\') {
                result += c;
                continue;
            }
            if (atEnd()) break;
            char e = text_[pos_++];
            switch (e) {
                case 'n': result += '\n'; break;
                case 't': result += '\t'; break;
                case 'r': result += '\r'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'u': {
                    if (pos_ + 4 > text_.size()) fail("truncated unicode escape");
                    unsigned int code = 0;
                    for (size_t i = 0; i < 4; ++i) {
                        char h = text_[pos_ + i];
                        if (!std::isxdigit(static_cast<unsigned char>(h))) {
                            fail("invalid unicode escape");
                        }
                        code = code * 16 + static_cast<unsigned int>(
                            std::isdigit(static_cast<unsigned char>(h))
                                ? h - '0'
                                : std::tolower(static_cast<unsigned char>(h)) - 'a' + 10);
                    }
                    pos_ += 4;
                    // Only the BMP is needed for catalogue names
                    if (code < 0x80) {
                        result += static_cast<char>(code);
                    } else if (code < 0x800) {
                        result += static_cast<char>(0xC0 | (code >> 6));
                        result += static_cast<char>(0x80 | (code & 0x3F));
                    } else {
                        result += static_cast<char>(0xE0 | (code >> 12));
                        result += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
                        result += static_cast<char>(0x80 | (code & 0x3F));
                    }
                    break;
                }
                default: result += e; break;
            }
        }
        fail("unterminated string");
        return result;
    }

    std::string readLiteral() {
        size_t start = pos_;
        while (!atEnd() && text_[pos_] != ',' && text_[pos_] != '}' &&
               !std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
        if (start == pos_) {
            fail("expected a value");
        }
        std::string literal = text_.substr(start, pos_ - start);
        if (literal.front() == '{' || literal.front() == '[') {
            fail("nested values are not supported");
        }
        return literal;
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw SyncException(ErrorCode::PARSE_ERROR,
                            "Invalid JSON at offset " + std::to_string(pos_) + ": " + what);
    }

private:
    const std::string& text_;
    size_t pos_;
};

} // anonymous namespace

std::map<std::string, std::string> SimpleJSON::parse(const std::string& json_str) {
    std::map<std::string, std::string> result;
    Scanner scanner(json_str);

    scanner.expect('{');
    scanner.skipWhitespace();
    if (scanner.peek() == '}') {
        scanner.expect('}');
        return result;
    }

    while (true) {
        scanner.skipWhitespace();
        std::string key = scanner.readString();
        scanner.expect(':');
        scanner.skipWhitespace();

        std::string value = scanner.peek() == '"' ? scanner.readString() : scanner.readLiteral();
        result[key] = value;

        scanner.skipWhitespace();
        if (scanner.peek() == ',') {
            scanner.expect(',');
            continue;
        }
        scanner.expect('}');
        break;
    }

    scanner.skipWhitespace();
    if (!scanner.atEnd()) {
        scanner.fail("trailing characters");
    }

    return result;
}

std::string SimpleJSON::serialize(const std::map<std::string, std::string>& values) {
    std::ostringstream json;
    json << "{";
    bool first = true;
    for (const auto& [key, value] : values) {
        if (!first) json << ", ";
        first = false;
        json << "\"" << escape(key) << "\": \"" << escape(value) << "\"";
    }
    json << "}";
    return json.str();
}

std::string SimpleJSON::escape(const std::string& str) {
    std::ostringstream escaped;
    for (char c : str) {
        switch (c) {
            case '"':  escaped << "\\\""; break;
            case '\\': escaped << "\\\\"; break;
            case '\n': escaped << "\\n"; break;
            case '\t': escaped << "\\t"; break;
            case '\r': escaped << "\\r"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    escaped << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                            << static_cast<int>(c) << std::dec;
                } else {
                    escaped << c;
                }
        }
    }
    return escaped.str();
}

} // namespace gaiasync
} // namespace ocl
