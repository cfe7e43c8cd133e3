#ifndef ENGRAM_CORE_CONFIG_HPP
#define ENGRAM_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <cstdint>

namespace engram {

// JSON-backed configuration with dot-notation lookups ("tiering.hot_age_days").
// A key missing from the file falls back to the ENGRAM_<KEY> environment
// variable, dots mapped to underscores (ENGRAM_TIERING_HOT_AGE_DAYS).
class Config {
public:
    Config();

    bool load_file(const std::string& path);
    bool load_string(const std::string& json_str);

    std::string get_string(const std::string& key, const std::string& def = "") const;
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    double get_double(const std::string& key, double def = 0.0) const;
    bool get_bool(const std::string& key, bool def = false) const;

    bool has(const std::string& key) const;

    const Json& get_section(const std::string& key) const;
    const Json& data() const;

    const std::string& last_error() const { return last_error_; }

    static std::string to_env_key(const std::string& key);

private:
    Json data_;
    std::string last_error_;

    bool env_lookup(const std::string& key, std::string& out) const;
};

} // namespace engram

#endif // ENGRAM_CORE_CONFIG_HPP
