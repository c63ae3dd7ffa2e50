/**
 * JSON Reader - recursive-descent parser for tuning files.
 *
 * Objects, arrays, strings, numbers, booleans, null. Parse errors carry
 * the line and column of the offending character.
 *
 *   auto root = JsonReader::parse_file("tuning.json");
 *   double m = root["discrete"]["hitMultiplier"].get_number(1.125);
 */

#ifndef RTP_IO_JSON_READER_HPP
#define RTP_IO_JSON_READER_HPP

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace rtp::io {

enum class JsonType {
    NIL,
    BOOL,
    NUMBER,
    STRING,
    OBJECT,
    ARRAY
};

std::string to_string(JsonType type);

class JsonValue {
public:
    JsonValue() = default;
    explicit JsonValue(bool v) : type_(JsonType::BOOL), bool_val_(v) {}
    explicit JsonValue(double v) : type_(JsonType::NUMBER), num_val_(v) {}
    explicit JsonValue(std::string v) : type_(JsonType::STRING), str_val_(std::move(v)) {}

    static JsonValue object() { JsonValue v; v.type_ = JsonType::OBJECT; return v; }
    static JsonValue array() { JsonValue v; v.type_ = JsonType::ARRAY; return v; }

    JsonType type() const { return type_; }

    bool is_null()   const { return type_ == JsonType::NIL; }
    bool is_bool()   const { return type_ == JsonType::BOOL; }
    bool is_number() const { return type_ == JsonType::NUMBER; }
    bool is_string() const { return type_ == JsonType::STRING; }
    bool is_object() const { return type_ == JsonType::OBJECT; }
    bool is_array()  const { return type_ == JsonType::ARRAY; }

    // Throw std::runtime_error on type mismatch
    bool as_bool() const;
    double as_number() const;
    const std::string& as_string() const;

    // Fall back to def when absent (null); throw when present with the wrong type
    double get_number(double def) const { return is_null() ? def : as_number(); }

    /** Member lookup; missing keys and non-objects yield null. */
    const JsonValue& operator[](const std::string& key) const;

    /** Element lookup; out-of-range and non-arrays yield null. */
    const JsonValue& operator[](size_t index) const;

    size_t size() const;

    const std::map<std::string, JsonValue>& members() const { return members_; }

    void add_member(const std::string& key, JsonValue&& val) { members_[key] = std::move(val); }
    void add_element(JsonValue&& val) { elements_.push_back(std::move(val)); }

private:
    JsonType type_ = JsonType::NIL;
    bool bool_val_ = false;
    double num_val_ = 0.0;
    std::string str_val_;
    std::map<std::string, JsonValue> members_;
    std::vector<JsonValue> elements_;
};

class JsonReader {
public:
    /** @throws std::runtime_error on syntax errors or trailing content */
    static JsonValue parse(const std::string& json);

    /** @throws std::runtime_error if the file cannot be read or parsed */
    static JsonValue parse_file(const std::string& path);
};

} // namespace rtp::io

#endif // RTP_IO_JSON_READER_HPP
