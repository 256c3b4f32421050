#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <unordered_map>

#include <raylib.h>

namespace core {

namespace {

std::string strip_quotes(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    if (s.size() >= 2) {
        const char a = s.front();
        const char b = s.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

} // namespace

Config& Config::instance() {
    static Config inst;
    return inst;
}

Config::Config() {
    reset();
}

void Config::reset() {
    config_ = ClientConfig{};
    config_.logging.level = LOG_INFO;
    loaded_from_path_.clear();
}

std::string Config::trim(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    return s;
}

std::string Config::to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool Config::parse_bool(const std::string& v, bool default_value) {
    std::string s = to_lower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return default_value;
}

int Config::parse_int(const std::string& v, int default_value) {
    try {
        std::size_t idx = 0;
        const std::string s = trim(v);
        const int out = std::stoi(s, &idx, 10);
        if (idx != s.size()) return default_value;
        return out;
    } catch (const std::logic_error&) {
        // std::invalid_argument / std::out_of_range
        return default_value;
    }
}

float Config::parse_float(const std::string& v, float default_value) {
    try {
        std::size_t idx = 0;
        const std::string s = trim(v);
        const float out = std::stof(s, &idx);
        if (idx != s.size()) return default_value;
        return out;
    } catch (const std::logic_error&) {
        return default_value;
    }
}

int Config::log_level_from_string(const std::string& v, int default_value) {
    std::string s = to_lower(strip_quotes(v));

    static const std::unordered_map<std::string, int> map = {
        {"all", LOG_ALL},
        {"trace", LOG_TRACE},
        {"debug", LOG_DEBUG},
        {"info", LOG_INFO},
        {"warning", LOG_WARNING}, {"warn", LOG_WARNING},
        {"error", LOG_ERROR},
        {"fatal", LOG_FATAL},
        {"none", LOG_NONE}, {"off", LOG_NONE},
    };

    auto it = map.find(s);
    if (it != map.end()) return it->second;

    // Allow numeric.
    return parse_int(s, default_value);
}

void Config::apply_kv(const std::string& section, const std::string& key, const std::string& value) {
    const std::string sec = to_lower(trim(section));
    const std::string k = to_lower(trim(key));
    const std::string v = strip_quotes(value);

    if (sec == "network") {
        auto& net = config_.network;
        if (k == "host") net.host = v;
        else if (k == "port") {
            const int port = parse_int(v, net.port);
            if (port > 0 && port <= 0xFFFF) net.port = static_cast<std::uint16_t>(port);
        }
        else if (k == "player_name" || k == "name") net.player_name = v;
        else if (k == "connect_timeout_ms") net.connect_timeout_ms = std::max(0, parse_int(v, net.connect_timeout_ms));
        else if (k == "poll_interval_ms") net.poll_interval_ms = std::max(0, parse_int(v, net.poll_interval_ms));
        return;
    }

    if (sec == "world") {
        auto& world = config_.world;
        if (k == "pixel_scale") {
            const float scale = parse_float(v, world.pixel_scale);
            if (scale > 0.0f) world.pixel_scale = scale;
        }
        else if (k == "viewport_radius_x") world.viewport_radius_x = std::max(0, parse_int(v, world.viewport_radius_x));
        else if (k == "viewport_radius_y") world.viewport_radius_y = std::max(0, parse_int(v, world.viewport_radius_y));
        else if (k == "screen_width") world.screen_width = std::max(0, parse_int(v, world.screen_width));
        else if (k == "screen_height") world.screen_height = std::max(0, parse_int(v, world.screen_height));
        else if (k == "move_speed") world.move_speed = parse_float(v, world.move_speed);
        else if (k == "tick_rate") world.tick_rate = std::max(1, parse_int(v, world.tick_rate));
        return;
    }

    if (sec == "chat") {
        if (k == "max_messages") config_.chat.max_messages = std::max(1, parse_int(v, config_.chat.max_messages));
        return;
    }

    if (sec == "logging") {
        if (k == "enabled") config_.logging.enabled = parse_bool(v, config_.logging.enabled);
        else if (k == "level") config_.logging.level = log_level_from_string(v, config_.logging.level);
        else if (k == "file") config_.logging.file = v;
        return;
    }
}

void Config::load_from_stream(std::istream& in) {
    std::string section;
    std::string line;

    while (std::getline(in, line)) {
        // Strip comments (# or ;) - cut at first occurrence.
        auto hash = line.find('#');
        auto semi = line.find(';');
        std::size_t cut = std::string::npos;
        if (hash != std::string::npos) cut = hash;
        if (semi != std::string::npos) cut = (cut == std::string::npos) ? semi : std::min(cut, semi);
        if (cut != std::string::npos) line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        if (line.front() == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty()) continue;

        apply_kv(section, key, value);
    }
}

bool Config::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    load_from_stream(in);
    loaded_from_path_ = path;
    return true;
}

} // namespace core
