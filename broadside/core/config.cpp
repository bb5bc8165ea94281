#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <unordered_map>

#include <raylib.h>

namespace broadside::core {

Config& Config::instance() {
    static Config inst;
    return inst;
}

Config::Config() {
    reset();
}

void Config::reset() {
    config_ = BroadsideConfig{};
    loaded_from_path_.clear();

    config_.logging.enabled = true;
    config_.logging.level = LOG_INFO;
    config_.logging.file = "";
    config_.logging.collision_debug = false;
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
        size_t idx = 0;
        const std::string s = trim(v);
        int out = std::stoi(s, &idx, 10);
        if (idx != s.size()) return default_value;
        return out;
    } catch (const std::logic_error&) {
        // invalid_argument or out_of_range
        return default_value;
    }
}

std::uint32_t Config::parse_uint32(const std::string& v, std::uint32_t default_value) {
    const std::string s = trim(v);
    // stoul would wrap a leading minus sign
    if (s.empty() || s.front() == '-' || s.front() == '+') return default_value;
    try {
        size_t idx = 0;
        const unsigned long out = std::stoul(s, &idx, 10);
        if (idx != s.size() || out > std::numeric_limits<std::uint32_t>::max()) return default_value;
        return static_cast<std::uint32_t>(out);
    } catch (const std::logic_error&) {
        return default_value;
    }
}

float Config::parse_float(const std::string& v, float default_value) {
    try {
        size_t idx = 0;
        const std::string s = trim(v);
        float out = std::stof(s, &idx);
        if (idx != s.size() || !std::isfinite(out)) return default_value;
        return out;
    } catch (const std::logic_error&) {
        return default_value;
    }
}

static std::string strip_quotes(std::string s) {
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

    if (sec == "logging") {
        auto& c = config_.logging;
        if (k == "enabled") c.enabled = parse_bool(v, c.enabled);
        else if (k == "level") c.level = log_level_from_string(v, c.level);
        else if (k == "file") c.file = v;
        else if (k == "collision_debug") c.collision_debug = parse_bool(v, c.collision_debug);
        return;
    }

    if (sec == "world") {
        auto& c = config_.world;
        if (k == "min_x") c.bounds.min_x = parse_float(v, c.bounds.min_x);
        else if (k == "max_x") c.bounds.max_x = parse_float(v, c.bounds.max_x);
        else if (k == "min_y") c.bounds.min_y = parse_float(v, c.bounds.min_y);
        else if (k == "max_y") c.bounds.max_y = parse_float(v, c.bounds.max_y);
        else if (k == "max_dt") c.max_dt = std::max(0.0f, parse_float(v, c.max_dt));
        else if (k == "boundary_bounce") c.boundary_bounce = std::clamp(parse_float(v, c.boundary_bounce), 0.0f, 1.0f);
        else if (k == "projectile_cull_margin") c.projectile_cull_margin = std::max(0.0f, parse_float(v, c.projectile_cull_margin));
        return;
    }

    if (sec == "collision") {
        auto& c = config_.collision;
        if (k == "restitution") c.restitution = std::clamp(parse_float(v, c.restitution), 0.0f, 1.0f);
        else if (k == "friction") c.friction = std::max(0.0f, parse_float(v, c.friction));
        else if (k == "ram_cooldown") c.ram_cooldown = std::max(0.0f, parse_float(v, c.ram_cooldown));
        return;
    }

    if (sec == "ai") {
        auto& c = config_.ai;
        if (k == "passive_timeout") c.passive_timeout = std::max(0.0f, parse_float(v, c.passive_timeout));
        else if (k == "fire_range") c.fire_range = std::max(0.0f, parse_float(v, c.fire_range));
        else if (k == "desired_distance") c.desired_distance = std::max(0.0f, parse_float(v, c.desired_distance));
        else if (k == "edge_margin") c.edge_margin = std::max(0.0f, parse_float(v, c.edge_margin));
        else if (k == "wander_pad") c.wander_pad = std::max(0.0f, parse_float(v, c.wander_pad));
        return;
    }

    if (sec == "sim") {
        auto& c = config_.sim;
        if (k == "seed") c.seed = parse_uint32(v, c.seed);
        else if (k == "raiders") c.raiders = std::max(0, parse_int(v, c.raiders));
        else if (k == "elites") c.elites = std::max(0, parse_int(v, c.elites));
        else if (k == "seconds") c.seconds = std::max(0.0f, parse_float(v, c.seconds));
        return;
    }
}

bool Config::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    std::string section;
    std::string line;

    while (std::getline(in, line)) {
        // Cut at the first comment marker
        auto hash = line.find('#');
        auto semi = line.find(';');
        size_t cut = std::string::npos;
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

    // A world that is inside out is not usable
    auto& b = config_.world.bounds;
    if (!(b.max_x > b.min_x) || !(b.max_y > b.min_y)) {
        TraceLog(LOG_WARNING, "[config] invalid world bounds in %s, using defaults", path.c_str());
        b = WorldBounds{};
    }

    loaded_from_path_ = path;
    return true;
}

} // namespace broadside::core
