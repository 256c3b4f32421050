#pragma once

#include "../../shared/transport/enet_common.hpp"

#include <cstdint>
#include <istream>
#include <string>

namespace core {

struct NetworkConfig {
    std::string host{"127.0.0.1"};
    std::uint16_t port{shared::transport::config::kDefaultPort};
    std::string player_name{"player"};

    int connect_timeout_ms{5000};

    // Receiver throttle between recv() calls (~60 Hz).
    int poll_interval_ms{16};
};

struct WorldConfig {
    // Screen pixels per block; local positions are stored in pixels.
    float pixel_scale{25.0f};

    // Chunks kept loaded around the player's chunk on each axis.
    int viewport_radius_x{2};
    int viewport_radius_y{2};

    // Window size in pixels. When both are set the radius is derived from
    // them instead of viewport_radius_x/y.
    int screen_width{0};
    int screen_height{0};

    // Client-side horizontal prediction speed, blocks per second.
    float move_speed{5.0f};

    int tick_rate{50};
};

struct ChatConfig {
    int max_messages{50};
};

struct LoggingConfig {
    bool enabled{true};
    int level{0};
    std::string file{};
};

struct ClientConfig {
    NetworkConfig network{};
    WorldConfig world{};
    ChatConfig chat{};
    LoggingConfig logging{};
};

class Config {
public:
    static Config& instance();

    bool load_from_file(const std::string& path);

    // INI-style: [section], key = value, '#' or ';' comments.
    void load_from_stream(std::istream& in);

    void reset();

    const std::string& loaded_from_path() const { return loaded_from_path_; }

    const ClientConfig& get() const { return config_; }

    const NetworkConfig& network() const { return config_.network; }
    const WorldConfig& world() const { return config_.world; }
    const ChatConfig& chat() const { return config_.chat; }
    const LoggingConfig& logging() const { return config_.logging; }

private:
    Config();

    ClientConfig config_{};

    std::string loaded_from_path_{};

    static std::string trim(std::string s);
    static std::string to_lower(std::string s);

    static bool parse_bool(const std::string& v, bool default_value);
    static int parse_int(const std::string& v, int default_value);
    static float parse_float(const std::string& v, float default_value);

    static int log_level_from_string(const std::string& v, int default_value);

    void apply_kv(const std::string& section, const std::string& key, const std::string& value);
};

} // namespace core
