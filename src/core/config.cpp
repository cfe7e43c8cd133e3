#include <engram/core/config.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>

namespace engram {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream f(path.c_str());
    if (!f.is_open()) {
        last_error_ = "cannot open config file: " + path;
        return false;
    }

    std::string content((std::istreambuf_iterator<char>(f)),
                        std::istreambuf_iterator<char>());
    if (!load_string(content)) {
        last_error_ = path + ": " + last_error_;
        return false;
    }
    LOG_DEBUG("Config: loaded %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& json_str) {
    try {
        Json parsed = Json::parse(json_str);
        if (!parsed.is_object()) {
            last_error_ = "config root must be a JSON object";
            return false;
        }
        data_ = parsed;
        last_error_.clear();
        return true;
    } catch (const std::runtime_error& e) {
        last_error_ = e.what();
        return false;
    }
}

std::string Config::to_env_key(const std::string& key) {
    std::string env = "ENGRAM_";
    for (size_t i = 0; i < key.size(); ++i) {
        char c = key[i];
        env += (c == '.' || c == '-') ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return env;
}

bool Config::env_lookup(const std::string& key, std::string& out) const {
    const char* value = std::getenv(to_env_key(key).c_str());
    if (!value || !value[0]) return false;
    out = value;
    LOG_DEBUG("Config: key '%s' taken from environment", key.c_str());
    return true;
}

bool Config::has(const std::string& key) const {
    std::string unused;
    return data_.find_path(key) != NULL || env_lookup(key, unused);
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json* node = data_.find_path(key);
    if (node && node->is_string()) {
        return node->as_string();
    }
    std::string env;
    if (env_lookup(key, env)) return env;
    return def;
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json* node = data_.find_path(key);
    if (node && node->is_number()) {
        return node->as_int();
    }
    std::string env;
    if (env_lookup(key, env)) {
        char* end = NULL;
        long long v = std::strtoll(env.c_str(), &end, 10);
        if (end && *end == '\0') return static_cast<int64_t>(v);
        LOG_WARN("Config: ignoring non-integer %s='%s'", to_env_key(key).c_str(), env.c_str());
    }
    return def;
}

double Config::get_double(const std::string& key, double def) const {
    const Json* node = data_.find_path(key);
    if (node && node->is_number()) {
        return node->as_number();
    }
    std::string env;
    if (env_lookup(key, env)) {
        char* end = NULL;
        double v = std::strtod(env.c_str(), &end);
        if (end && *end == '\0') return v;
        LOG_WARN("Config: ignoring non-numeric %s='%s'", to_env_key(key).c_str(), env.c_str());
    }
    return def;
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json* node = data_.find_path(key);
    if (node && node->is_bool()) {
        return node->as_bool();
    }
    std::string env;
    if (env_lookup(key, env)) {
        std::string v = to_lower(trim(env));
        if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
        if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    }
    return def;
}

const Json& Config::get_section(const std::string& key) const {
    static const Json null_json;
    const Json* node = data_.find_path(key);
    return node ? *node : null_json;
}

const Json& Config::data() const { return data_; }

} // namespace engram
