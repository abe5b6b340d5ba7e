#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace epubkit {

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::unordered_map<std::string, std::string> load_env(const std::filesystem::path& path) {
    std::unordered_map<std::string, std::string> env;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) continue;
        std::string key = trim(line.substr(0, pos));
        std::string val = trim(line.substr(pos + 1));
        env[key] = val;
    }
    return env;
}

static bool parse_bool(const std::string& key, const std::string& value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "1" || lower == "yes") return true;
    if (lower == "false" || lower == "0" || lower == "no") return false;
    throw std::runtime_error("invalid boolean for " + key + ": " + value);
}

Config config_from_env(const std::unordered_map<std::string, std::string>& env) {
    Config config;

    auto it = env.find("EPUBKIT_LOG_LEVEL");
    if (it != env.end() && !parse_log_level(it->second, config.log_level))
        throw std::runtime_error("invalid EPUBKIT_LOG_LEVEL: " + it->second);

    it = env.find("EPUBKIT_OMIT_LEGACY");
    if (it != env.end()) config.omit_legacy = parse_bool(it->first, it->second);

    it = env.find("EPUBKIT_XML_INDENT");
    if (it != env.end()) {
        const std::string& v = it->second;
        if (v.empty() || v.size() > 2 ||
            !std::all_of(v.begin(), v.end(), [](unsigned char c) { return std::isdigit(c); }))
            throw std::runtime_error("invalid EPUBKIT_XML_INDENT: " + v);
        config.xml_indent = std::stoi(v);
    }
    return config;
}

Config load_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        log_debug("no config at " + path.string() + ", using defaults");
        return Config{};
    }
    return config_from_env(load_env(path));
}

void apply_config(const Config& config) {
    set_log_level(config.log_level);
}

} // namespace epubkit
