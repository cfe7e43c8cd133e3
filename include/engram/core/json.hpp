/*
 * Engram C++11 - JSON value
 *
 * Small JSON document type used for configuration, the persisted keyword,
 * entity and id lists, the HTTP embedding protocol and CLI output.
 */
#ifndef ENGRAM_CORE_JSON_HPP
#define ENGRAM_CORE_JSON_HPP

#include <string>
#include <vector>
#include <map>
#include <sstream>
#include <stdexcept>
#include <cstdint>
#include <cstddef>

namespace engram {

class Json {
public:
    enum Type { NUL, BOOL, NUMBER, STRING, ARRAY, OBJECT };

    Json() : type_(NUL), bool_(false), number_(0) {}
    Json(bool b) : type_(BOOL), bool_(b), number_(0) {}
    Json(int n) : type_(NUMBER), bool_(false), number_(n) {}
    Json(int64_t n) : type_(NUMBER), bool_(false), number_(static_cast<double>(n)) {}
    Json(size_t n) : type_(NUMBER), bool_(false), number_(static_cast<double>(n)) {}
    Json(double n) : type_(NUMBER), bool_(false), number_(n) {}
    Json(const char* s) : type_(STRING), bool_(false), number_(0), string_(s) {}
    Json(const std::string& s) : type_(STRING), bool_(false), number_(0), string_(s) {}
    Json(const std::vector<Json>& arr) : type_(ARRAY), bool_(false), number_(0), array_(arr) {}
    Json(const std::map<std::string, Json>& obj) : type_(OBJECT), bool_(false), number_(0), object_(obj) {}

    Type type() const { return type_; }
    bool is_null() const { return type_ == NUL; }
    bool is_bool() const { return type_ == BOOL; }
    bool is_number() const { return type_ == NUMBER; }
    bool is_string() const { return type_ == STRING; }
    bool is_array() const { return type_ == ARRAY; }
    bool is_object() const { return type_ == OBJECT; }

    bool as_bool(bool def = false) const;
    double as_number(double def = 0) const;
    int64_t as_int(int64_t def = 0) const;
    std::string as_string(const std::string& def = "") const;
    const std::vector<Json>& as_array() const;
    const std::map<std::string, Json>& as_object() const;

    // Missing keys and out-of-range indices yield a shared null value
    const Json& operator[](const std::string& key) const;
    const Json& operator[](size_t idx) const;
    bool has(const std::string& key) const;
    size_t size() const;

    // Walks nested objects along a dot-separated path ("search.half_life_days").
    // Returns NULL when any segment is missing.
    const Json* find_path(const std::string& dotted) const;

    void set(const std::string& key, const Json& value);
    void push(const Json& value);

    std::string get_string(const std::string& key, const std::string& def = "") const;
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    double get_double(const std::string& key, double def = 0.0) const;
    bool get_bool(const std::string& key, bool def = false) const;

    static Json object();
    static Json array();
    static Json from_strings(const std::vector<std::string>& values);
    std::vector<std::string> to_strings() const;

    // indent < 0 produces the compact form
    std::string dump(int indent = -1) const;

    // Throws std::runtime_error on malformed input or trailing garbage
    static Json parse(const std::string& str);

private:
    Type type_;
    bool bool_;
    double number_;
    std::string string_;
    std::vector<Json> array_;
    std::map<std::string, Json> object_;

    void dump_impl(std::ostringstream& ss, int indent, int depth) const;
    static void escape_string(std::ostringstream& ss, const std::string& s);
    static void append_utf8(std::string& out, unsigned int code_point);

    static void skip_ws(const std::string& s, size_t& pos);
    static Json parse_value(const std::string& s, size_t& pos, int depth);
    static Json parse_literal(const std::string& s, size_t& pos);
    static Json parse_number(const std::string& s, size_t& pos);
    static std::string parse_string(const std::string& s, size_t& pos);
    static Json parse_array(const std::string& s, size_t& pos, int depth);
    static Json parse_object(const std::string& s, size_t& pos, int depth);
    static std::runtime_error parse_error(const std::string& what, size_t pos);
};

} // namespace engram

#endif // ENGRAM_CORE_JSON_HPP
