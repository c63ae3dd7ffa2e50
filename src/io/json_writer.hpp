/**
 * JsonWriter - streaming JSON output (header-only).
 *
 * Pretty-printed with indent_size > 0, single-line with indent_size == 0
 * (used for JSON-Lines progress records).
 *
 *   JsonWriter w(std::cout);
 *   w.begin_object();
 *     w.kv("trials", trials);
 *     w.key("events").begin_object();
 *       w.kv("hitA", 0.45);
 *     w.end_object();
 *   w.end_object();
 */

#ifndef RTP_IO_JSON_WRITER_HPP
#define RTP_IO_JSON_WRITER_HPP

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <ostream>
#include <string>
#include <vector>

namespace rtp::io {

class JsonWriter {
public:
    explicit JsonWriter(std::ostream& os, int indent_size = 2)
        : os_(os), indent_size_(indent_size) {}

    // ── Structure ──

    JsonWriter& begin_object() { return open('{'); }
    JsonWriter& end_object() { return close('}'); }
    JsonWriter& begin_array() { return open('['); }
    JsonWriter& end_array() { return close(']'); }

    // ── Members ──

    JsonWriter& key(const std::string& k) {
        separate();
        write_string(k);
        os_ << (indent_size_ > 0 ? ": " : ":");
        after_key_ = true;
        return *this;
    }

    // ── Values ──

    JsonWriter& value(const std::string& v) {
        separate();
        write_string(v);
        return done();
    }

    JsonWriter& value(const char* v) { return value(std::string(v)); }

    JsonWriter& value(int v) {
        separate();
        os_ << v;
        return done();
    }

    JsonWriter& value(unsigned v) {
        separate();
        os_ << v;
        return done();
    }

    JsonWriter& value(uint64_t v) {
        separate();
        os_ << v;
        return done();
    }

    JsonWriter& value(double v) {
        separate();
        if (std::isnan(v) || std::isinf(v)) {
            os_ << "null";
        } else {
            os_ << std::setprecision(15) << v;
        }
        return done();
    }

    JsonWriter& value(bool v) {
        separate();
        os_ << (v ? "true" : "false");
        return done();
    }

    JsonWriter& null_value() {
        separate();
        os_ << "null";
        return done();
    }

    template<typename T>
    JsonWriter& kv(const std::string& k, const T& v) {
        key(k);
        return value(v);
    }

private:
    std::ostream& os_;
    int indent_size_;
    std::vector<int> counts_;   // items written per open scope
    bool after_key_ = false;

    JsonWriter& open(char bracket) {
        separate();
        after_key_ = false;
        os_ << bracket;
        counts_.push_back(0);
        return *this;
    }

    JsonWriter& close(char bracket) {
        bool empty = !counts_.empty() && counts_.back() == 0;
        if (!counts_.empty()) counts_.pop_back();
        if (!empty) newline();
        os_ << bracket;
        return done();
    }

    JsonWriter& done() {
        after_key_ = false;
        return *this;
    }

    // Comma and indentation before the next item; nothing right after a key.
    void separate() {
        if (after_key_ || counts_.empty()) return;
        if (counts_.back() > 0) os_ << ',';
        counts_.back()++;
        newline();
    }

    void newline() {
        if (indent_size_ <= 0) return;
        os_ << '\n' << std::string(counts_.size() * static_cast<size_t>(indent_size_), ' ');
    }

    void write_string(const std::string& s) {
        os_ << '"';
        for (char c : s) {
            switch (c) {
                case '"':  os_ << "\\\""; break;
                case '\\': os_ << "\\\\"; break;
                case '\n': os_ << "\\n";  break;
                case '\r': os_ << "\\r";  break;
                case '\t': os_ << "\\t";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x",
                                      static_cast<unsigned>(static_cast<unsigned char>(c)));
                        os_ << buf;
                    } else {
                        os_ << c;
                    }
                    break;
            }
        }
        os_ << '"';
    }
};

} // namespace rtp::io

#endif // RTP_IO_JSON_WRITER_HPP
