#include "io/json_reader.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace rtp::io {

// ═══════════════════════════════════════════════════════════════
// JsonValue
// ═══════════════════════════════════════════════════════════════

std::string to_string(JsonType type) {
    switch (type) {
        case JsonType::NIL:    return "null";
        case JsonType::BOOL:   return "bool";
        case JsonType::NUMBER: return "number";
        case JsonType::STRING: return "string";
        case JsonType::OBJECT: return "object";
        case JsonType::ARRAY:  return "array";
    }
    return "unknown";
}

namespace {

const JsonValue& null_value() {
    static const JsonValue nil;
    return nil;
}

std::runtime_error type_error(JsonType want, JsonType got) {
    return std::runtime_error("JsonValue: expected " + to_string(want) +
                              ", got " + to_string(got));
}

} // namespace

bool JsonValue::as_bool() const {
    if (type_ != JsonType::BOOL) throw type_error(JsonType::BOOL, type_);
    return bool_val_;
}

double JsonValue::as_number() const {
    if (type_ != JsonType::NUMBER) throw type_error(JsonType::NUMBER, type_);
    return num_val_;
}

const std::string& JsonValue::as_string() const {
    if (type_ != JsonType::STRING) throw type_error(JsonType::STRING, type_);
    return str_val_;
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    auto it = members_.find(key);
    if (type_ != JsonType::OBJECT || it == members_.end()) return null_value();
    return it->second;
}

const JsonValue& JsonValue::operator[](size_t index) const {
    if (type_ != JsonType::ARRAY || index >= elements_.size()) return null_value();
    return elements_[index];
}

size_t JsonValue::size() const {
    if (type_ == JsonType::ARRAY) return elements_.size();
    if (type_ == JsonType::OBJECT) return members_.size();
    return 0;
}

// ═══════════════════════════════════════════════════════════════
// Parser
// ═══════════════════════════════════════════════════════════════

namespace {

class Parser {
public:
    explicit Parser(const std::string& src) : src_(src) {}

    JsonValue parse_document() {
        JsonValue root = parse_value();
        skip_whitespace();
        if (pos_ < src_.size()) throw error("trailing content after document");
        return root;
    }

private:
    const std::string& src_;
    size_t pos_ = 0;

    char peek() const { return pos_ < src_.size() ? src_[pos_] : '\0'; }

    char advance() {
        if (pos_ >= src_.size()) throw error("unexpected end of input");
        return src_[pos_++];
    }

    void expect(char c) {
        if (advance() != c) {
            pos_--;
            throw error(std::string("expected '") + c + "'");
        }
    }

    void skip_whitespace() {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) {
            pos_++;
        }
    }

    bool consume_literal(const char* word) {
        std::string w(word);
        if (src_.compare(pos_, w.size(), w) != 0) return false;
        pos_ += w.size();
        return true;
    }

    std::runtime_error error(const std::string& msg) const {
        size_t line = 1, col = 1;
        for (size_t i = 0; i < pos_ && i < src_.size(); i++) {
            if (src_[i] == '\n') { line++; col = 1; }
            else col++;
        }
        return std::runtime_error("JSON parse error at line " + std::to_string(line) +
                                  ", column " + std::to_string(col) + ": " + msg);
    }

    JsonValue parse_value() {
        skip_whitespace();
        char c = peek();

        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == '"') return JsonValue(parse_string());
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();
        if (consume_literal("true")) return JsonValue(true);
        if (consume_literal("false")) return JsonValue(false);
        if (consume_literal("null")) return JsonValue();

        throw error(c == '\0' ? std::string("unexpected end of input")
                              : std::string("unexpected character '") + c + "'");
    }

    std::string parse_string() {
        expect('"');
        std::string out;
        while (true) {
            char c = advance();
            if (c == '"') break;
            if (c != '\\') {
                out += c;
                continue;
            }
            char esc = advance();
            switch (esc) {
                case '"':  out += '"';  break;
                case '\\': out += '\\'; break;
                case '/':  out += '/';  break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    if (pos_ + 4 > src_.size()) throw error("incomplete \\u escape");
                    unsigned long code = 0;
                    for (int k = 0; k < 4; k++) {
                        char h = src_[pos_];
                        if (!std::isxdigit(static_cast<unsigned char>(h))) {
                            throw error(std::string("invalid hex digit '") + h + "' in \\u escape");
                        }
                        code = code * 16 + static_cast<unsigned long>(
                            std::isdigit(static_cast<unsigned char>(h))
                                ? h - '0'
                                : std::tolower(static_cast<unsigned char>(h)) - 'a' + 10);
                        advance();
                    }
                    // BMP only, UTF-8 encoded
                    if (code < 0x80) {
                        out += static_cast<char>(code);
                    } else if (code < 0x800) {
                        out += static_cast<char>(0xC0 | (code >> 6));
                        out += static_cast<char>(0x80 | (code & 0x3F));
                    } else {
                        out += static_cast<char>(0xE0 | (code >> 12));
                        out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
                        out += static_cast<char>(0x80 | (code & 0x3F));
                    }
                    break;
                }
                default:
                    throw error(std::string("unknown escape \\") + esc);
            }
        }
        return out;
    }

    void digits(const char* what) {
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            throw error(std::string("expected digit in ") + what);
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) pos_++;
    }

    JsonValue parse_number() {
        size_t start = pos_;
        if (peek() == '-') pos_++;

        if (peek() == '0') pos_++;
        else digits("number");

        if (peek() == '.') {
            pos_++;
            digits("fraction");
        }
        if (peek() == 'e' || peek() == 'E') {
            pos_++;
            if (peek() == '+' || peek() == '-') pos_++;
            digits("exponent");
        }

        return JsonValue(std::strtod(src_.substr(start, pos_ - start).c_str(), nullptr));
    }

    JsonValue parse_object() {
        expect('{');
        JsonValue obj = JsonValue::object();

        skip_whitespace();
        if (peek() == '}') {
            pos_++;
            return obj;
        }

        while (true) {
            skip_whitespace();
            std::string key = parse_string();
            skip_whitespace();
            expect(':');
            obj.add_member(key, parse_value());

            skip_whitespace();
            if (peek() != ',') break;
            pos_++;
        }

        skip_whitespace();
        expect('}');
        return obj;
    }

    JsonValue parse_array() {
        expect('[');
        JsonValue arr = JsonValue::array();

        skip_whitespace();
        if (peek() == ']') {
            pos_++;
            return arr;
        }

        while (true) {
            arr.add_element(parse_value());
            skip_whitespace();
            if (peek() != ',') break;
            pos_++;
        }

        skip_whitespace();
        expect(']');
        return arr;
    }
};

} // namespace

JsonValue JsonReader::parse(const std::string& json) {
    Parser parser(json);
    return parser.parse_document();
}

JsonValue JsonReader::parse_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open JSON file: " + path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return parse(ss.str());
}

} // namespace rtp::io
