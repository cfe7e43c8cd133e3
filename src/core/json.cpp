#include <engram/core/json.hpp>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <limits>

namespace engram {

namespace {

const int MAX_PARSE_DEPTH = 128;

const Json& null_value() {
    static const Json null_json;
    return null_json;
}

} // anonymous namespace

// ============ Accessors ============

bool Json::as_bool(bool def) const {
    return type_ == BOOL ? bool_ : def;
}

double Json::as_number(double def) const {
    return type_ == NUMBER ? number_ : def;
}

int64_t Json::as_int(int64_t def) const {
    return type_ == NUMBER ? static_cast<int64_t>(number_) : def;
}

std::string Json::as_string(const std::string& def) const {
    return type_ == STRING ? string_ : def;
}

const std::vector<Json>& Json::as_array() const {
    static const std::vector<Json> empty;
    return type_ == ARRAY ? array_ : empty;
}

const std::map<std::string, Json>& Json::as_object() const {
    static const std::map<std::string, Json> empty;
    return type_ == OBJECT ? object_ : empty;
}

const Json& Json::operator[](const std::string& key) const {
    if (type_ != OBJECT) return null_value();
    std::map<std::string, Json>::const_iterator it = object_.find(key);
    return it != object_.end() ? it->second : null_value();
}

const Json& Json::operator[](size_t idx) const {
    if (type_ != ARRAY || idx >= array_.size()) return null_value();
    return array_[idx];
}

bool Json::has(const std::string& key) const {
    return type_ == OBJECT && object_.find(key) != object_.end();
}

size_t Json::size() const {
    if (type_ == ARRAY) return array_.size();
    if (type_ == OBJECT) return object_.size();
    return 0;
}

const Json* Json::find_path(const std::string& dotted) const {
    const Json* node = this;
    size_t start = 0;
    while (start <= dotted.size()) {
        size_t dot = dotted.find('.', start);
        std::string segment = dotted.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (segment.empty() || !node->is_object()) return NULL;
        std::map<std::string, Json>::const_iterator it = node->object_.find(segment);
        if (it == node->object_.end()) return NULL;
        node = &it->second;
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return node;
}

// ============ Modifiers ============

void Json::set(const std::string& key, const Json& value) {
    if (type_ != OBJECT) {
        type_ = OBJECT;
        object_.clear();
    }
    object_[key] = value;
}

void Json::push(const Json& value) {
    if (type_ != ARRAY) {
        type_ = ARRAY;
        array_.clear();
    }
    array_.push_back(value);
}

std::string Json::get_string(const std::string& key, const std::string& def) const {
    const Json& v = (*this)[key];
    return v.is_string() ? v.string_ : def;
}

int64_t Json::get_int(const std::string& key, int64_t def) const {
    const Json& v = (*this)[key];
    return v.is_number() ? static_cast<int64_t>(v.number_) : def;
}

double Json::get_double(const std::string& key, double def) const {
    const Json& v = (*this)[key];
    return v.is_number() ? v.number_ : def;
}

bool Json::get_bool(const std::string& key, bool def) const {
    const Json& v = (*this)[key];
    return v.is_bool() ? v.bool_ : def;
}

Json Json::object() {
    Json j;
    j.type_ = OBJECT;
    return j;
}

Json Json::array() {
    Json j;
    j.type_ = ARRAY;
    return j;
}

Json Json::from_strings(const std::vector<std::string>& values) {
    Json arr = Json::array();
    for (size_t i = 0; i < values.size(); ++i) {
        arr.push(Json(values[i]));
    }
    return arr;
}

std::vector<std::string> Json::to_strings() const {
    std::vector<std::string> out;
    for (size_t i = 0; i < array_.size() && type_ == ARRAY; ++i) {
        if (array_[i].is_string()) out.push_back(array_[i].string_);
    }
    return out;
}

// ============ Serialization ============

std::string Json::dump(int indent) const {
    std::ostringstream ss;
    dump_impl(ss, indent, 0);
    return ss.str();
}

void Json::dump_impl(std::ostringstream& ss, int indent, int depth) const {
    const bool pretty = indent >= 0;
    std::string pad_inner = pretty ? std::string(static_cast<size_t>(indent * (depth + 1)), ' ') : "";
    std::string pad_outer = pretty ? std::string(static_cast<size_t>(indent * depth), ' ') : "";

    switch (type_) {
        case NUL:
            ss << "null";
            break;
        case BOOL:
            ss << (bool_ ? "true" : "false");
            break;
        case NUMBER: {
            if (std::isnan(number_) || std::isinf(number_)) {
                ss << "null";
                break;
            }
            double integral = 0;
            if (std::modf(number_, &integral) == 0.0 &&
                std::fabs(number_) < 9.0e15) {
                ss << static_cast<int64_t>(number_);
            } else {
                ss << std::setprecision(std::numeric_limits<double>::digits10) << number_;
            }
            break;
        }
        case STRING:
            ss << '"';
            escape_string(ss, string_);
            ss << '"';
            break;
        case ARRAY:
            if (array_.empty()) {
                ss << "[]";
                break;
            }
            ss << '[';
            for (size_t i = 0; i < array_.size(); ++i) {
                if (i > 0) ss << ',';
                if (pretty) ss << '\n' << pad_inner;
                array_[i].dump_impl(ss, indent, depth + 1);
            }
            if (pretty) ss << '\n' << pad_outer;
            ss << ']';
            break;
        case OBJECT: {
            if (object_.empty()) {
                ss << "{}";
                break;
            }
            ss << '{';
            bool first = true;
            for (std::map<std::string, Json>::const_iterator it = object_.begin();
                 it != object_.end(); ++it) {
                if (!first) ss << ',';
                first = false;
                if (pretty) ss << '\n' << pad_inner;
                ss << '"';
                escape_string(ss, it->first);
                ss << (pretty ? "\": " : "\":");
                it->second.dump_impl(ss, indent, depth + 1);
            }
            if (pretty) ss << '\n' << pad_outer;
            ss << '}';
            break;
        }
    }
}

void Json::escape_string(std::ostringstream& ss, const std::string& s) {
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        switch (c) {
            case '"': ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\b': ss << "\\b"; break;
            case '\f': ss << "\\f"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    ss << buf;
                } else {
                    ss << c;
                }
        }
    }
}

void Json::append_utf8(std::string& out, unsigned int cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// ============ Parsing ============

std::runtime_error Json::parse_error(const std::string& what, size_t pos) {
    std::ostringstream oss;
    oss << "JSON parse error at offset " << pos << ": " << what;
    return std::runtime_error(oss.str());
}

Json Json::parse(const std::string& str) {
    size_t pos = 0;
    Json value = parse_value(str, pos, 0);
    skip_ws(str, pos);
    if (pos != str.size()) {
        throw parse_error("unexpected trailing characters", pos);
    }
    return value;
}

void Json::skip_ws(const std::string& s, size_t& pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) pos++;
}

Json Json::parse_value(const std::string& s, size_t& pos, int depth) {
    if (depth > MAX_PARSE_DEPTH) {
        throw parse_error("nesting too deep", pos);
    }
    skip_ws(s, pos);
    if (pos >= s.size()) {
        throw parse_error("unexpected end of input", pos);
    }

    char c = s[pos];
    if (c == '{') return parse_object(s, pos, depth + 1);
    if (c == '[') return parse_array(s, pos, depth + 1);
    if (c == '"') return Json(parse_string(s, pos));
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number(s, pos);
    if (c == 'n' || c == 't' || c == 'f') return parse_literal(s, pos);

    throw parse_error(std::string("unexpected character '") + c + "'", pos);
}

Json Json::parse_literal(const std::string& s, size_t& pos) {
    if (s.compare(pos, 4, "null") == 0) {
        pos += 4;
        return Json();
    }
    if (s.compare(pos, 4, "true") == 0) {
        pos += 4;
        return Json(true);
    }
    if (s.compare(pos, 5, "false") == 0) {
        pos += 5;
        return Json(false);
    }
    throw parse_error("invalid literal", pos);
}

Json Json::parse_number(const std::string& s, size_t& pos) {
    size_t start = pos;
    if (s[pos] == '-') pos++;
    size_t digits_start = pos;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
    if (pos == digits_start) {
        throw parse_error("expected digits", pos);
    }
    if (pos < s.size() && s[pos] == '.') {
        pos++;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
    }
    if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
        pos++;
        if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) pos++;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
    }
    return Json(std::strtod(s.substr(start, pos - start).c_str(), NULL));
}

std::string Json::parse_string(const std::string& s, size_t& pos) {
    size_t open = pos;
    pos++; // opening quote
    std::string result;
    while (pos < s.size() && s[pos] != '"') {
        char c = s[pos];
        if (c != '\\') {
            result += c;
            pos++;
            continue;
        }
        if (++pos >= s.size()) break;
        switch (s[pos]) {
            case '"': result += '"'; break;
            case '\\': result += '\\'; break;
            case '/': result += '/'; break;
            case 'b': result += '\b'; break;
            case 'f': result += '\f'; break;
            case 'n': result += '\n'; break;
            case 'r': result += '\r'; break;
            case 't': result += '\t'; break;
            case 'u': {
                if (pos + 4 >= s.size()) {
                    throw parse_error("truncated unicode escape", pos);
                }
                unsigned int cp = static_cast<unsigned int>(
                    std::strtoul(s.substr(pos + 1, 4).c_str(), NULL, 16));
                pos += 4;
                // Surrogate pair
                if (cp >= 0xD800 && cp <= 0xDBFF && pos + 6 < s.size() &&
                    s[pos + 1] == '\\' && s[pos + 2] == 'u') {
                    unsigned int low = static_cast<unsigned int>(
                        std::strtoul(s.substr(pos + 3, 4).c_str(), NULL, 16));
                    if (low >= 0xDC00 && low <= 0xDFFF) {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        pos += 6;
                    }
                }
                append_utf8(result, cp);
                break;
            }
            default:
                throw parse_error("invalid escape sequence", pos);
        }
        pos++;
    }
    if (pos >= s.size()) {
        throw parse_error("unterminated string", open);
    }
    pos++; // closing quote
    return result;
}

Json Json::parse_array(const std::string& s, size_t& pos, int depth) {
    pos++; // [
    Json arr = Json::array();
    skip_ws(s, pos);
    if (pos < s.size() && s[pos] == ']') {
        pos++;
        return arr;
    }
    while (true) {
        arr.push(parse_value(s, pos, depth));
        skip_ws(s, pos);
        if (pos >= s.size()) throw parse_error("unterminated array", pos);
        if (s[pos] == ']') {
            pos++;
            return arr;
        }
        if (s[pos] != ',') throw parse_error("expected ',' or ']'", pos);
        pos++;
    }
}

Json Json::parse_object(const std::string& s, size_t& pos, int depth) {
    pos++; // {
    Json obj = Json::object();
    skip_ws(s, pos);
    if (pos < s.size() && s[pos] == '}') {
        pos++;
        return obj;
    }
    while (true) {
        skip_ws(s, pos);
        if (pos >= s.size() || s[pos] != '"') throw parse_error("expected object key", pos);
        std::string key = parse_string(s, pos);
        skip_ws(s, pos);
        if (pos >= s.size() || s[pos] != ':') throw parse_error("expected ':'", pos);
        pos++;
        obj.set(key, parse_value(s, pos, depth));
        skip_ws(s, pos);
        if (pos >= s.size()) throw parse_error("unterminated object", pos);
        if (s[pos] == '}') {
            pos++;
            return obj;
        }
        if (s[pos] != ',') throw parse_error("expected ',' or '}'", pos);
        pos++;
    }
}

} // namespace engram
