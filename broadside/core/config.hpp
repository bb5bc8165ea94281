#pragma once

#include "types.hpp"

#include <cstdint>
#include <string>

namespace broadside::core {

struct LoggingConfig {
    bool enabled{true};
    int level{0};
    std::string file{};

    bool collision_debug{false};
};

struct BroadsideConfig {
    LoggingConfig logging{};

    struct WorldConfig {
        WorldBounds bounds{};
        float max_dt{0.033f};
        float boundary_bounce{0.4f};
        float projectile_cull_margin{500.0f};
    } world{};

    struct CollisionConfig {
        float restitution{0.2f};
        float friction{0.08f};
        float ram_cooldown{4.0f};
    } collision{};

    struct AiConfig {
        float passive_timeout{15.0f};
        float fire_range{520.0f};
        float desired_distance{320.0f};
        float edge_margin{1200.0f};
        float wander_pad{2000.0f};
    } ai{};

    struct SimConfig {
        std::uint32_t seed{1337};
        int raiders{6};
        int elites{1};
        float seconds{120.0f};
    } sim{};
};

class Config {
public:
    static Config& instance();

    bool load_from_file(const std::string& path);

    /// Back to built-in defaults, forgetting any loaded file.
    void reset();

    const std::string& loaded_from_path() const { return loaded_from_path_; }

    const BroadsideConfig& get() const { return config_; }

    const LoggingConfig& logging() const { return config_.logging; }
    const BroadsideConfig::WorldConfig& world() const { return config_.world; }
    const BroadsideConfig::CollisionConfig& collision() const { return config_.collision; }
    const BroadsideConfig::AiConfig& ai() const { return config_.ai; }
    const BroadsideConfig::SimConfig& sim() const { return config_.sim; }

    void apply_kv(const std::string& section, const std::string& key, const std::string& value);

private:
    Config();

    BroadsideConfig config_{};

    std::string loaded_from_path_{};

    static std::string trim(std::string s);
    static std::string to_lower(std::string s);

    static bool parse_bool(const std::string& v, bool default_value);
    static int parse_int(const std::string& v, int default_value);
    static std::uint32_t parse_uint32(const std::string& v, std::uint32_t default_value);
    static float parse_float(const std::string& v, float default_value);

    static int log_level_from_string(const std::string& v, int default_value);
};

} // namespace broadside::core
