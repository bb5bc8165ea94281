// Broadside - headless skirmish runner
// Runs the naval combat simulation without rendering and logs what happens.

#include "broadside/core/config.hpp"
#include "broadside/core/logger.hpp"
#include "broadside/math/vec2.hpp"
#include "broadside/sim/simulation.hpp"
#include "broadside/sim/vessel_factory.hpp"

#include <raylib.h>

#include <cmath>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <random>
#include <string>

#ifndef BROADSIDE_VERSION
#define BROADSIDE_VERSION "0.0.0-dev"
#endif

namespace {

constexpr float kTickDt = 1.0f / 60.0f;
constexpr float kSummaryInterval = 10.0f;   // seconds of sim time
constexpr float kTorpedoInterval = 20.0f;
constexpr float kSpawnInner = 1200.0f;
constexpr float kSpawnOuter = 2600.0f;
constexpr float kEliteDistance = 3000.0f;

volatile std::sig_atomic_t g_running = 1;

void signal_handler(int sig) {
    (void)sig;
    g_running = 0;
}

void print_banner() {
    std::cout << R"(
  ___              _    _    _
 | _ )_ _ ___  __ _| |__| |__(_)__| |___
 | _ \ '_/ _ \/ _` | / _` (_-< / _` / -_)
 |___/_| \___/\__,_|_\__,_/__/_\__,_\___|
)" << '\n';
    std::cout << "  Broadside headless skirmish v" << BROADSIDE_VERSION << "\n";
    std::cout << "  ============================================\n\n";
}

void print_usage(const char* progname) {
    std::cout << "Usage: " << progname << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>     INI configuration (default: config/broadside.ini)\n";
    std::cout << "  --seconds <n>       Simulated seconds to run\n";
    std::cout << "  --raiders <n>       Autonomous raiders to spawn\n";
    std::cout << "  --elites <n>        Capital ships to spawn\n";
    std::cout << "  --seed <n>          Random seed\n";
    std::cout << "  --verbose           Enable debug logging\n";
    std::cout << "  --quiet             Disable most logging\n";
    std::cout << "  --help              Show this help message\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << progname << " --raiders 8 --elites 1 --seconds 300\n";
}

struct Args {
    std::string config_path = "config/broadside.ini";
    float seconds = -1.0f;
    int raiders = -1;
    int elites = -1;
    long long seed = -1;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            args.help = true;
        }
        else if (std::strcmp(arg, "--config") == 0 && i + 1 < argc) {
            args.config_path = argv[++i];
        }
        else if (std::strcmp(arg, "--seconds") == 0 && i + 1 < argc) {
            args.seconds = static_cast<float>(std::atof(argv[++i]));
        }
        else if (std::strcmp(arg, "--raiders") == 0 && i + 1 < argc) {
            args.raiders = std::atoi(argv[++i]);
        }
        else if (std::strcmp(arg, "--elites") == 0 && i + 1 < argc) {
            args.elites = std::atoi(argv[++i]);
        }
        else if (std::strcmp(arg, "--seed") == 0 && i + 1 < argc) {
            args.seed = std::atoll(argv[++i]);
        }
        else if (std::strcmp(arg, "--verbose") == 0) {
            args.verbose = true;
        }
        else if (std::strcmp(arg, "--quiet") == 0) {
            args.quiet = true;
        }
        else {
            std::cerr << "[WARNING] Unknown argument: " << arg << "\n";
        }
    }

    return args;
}

Vector2 annulus_point(std::mt19937& rng, Vector2 center, float inner, float outer) {
    std::uniform_real_distribution<float> angle(-broadside::math::kPi, broadside::math::kPi);
    std::uniform_real_distribution<float> radius(inner, outer);
    return broadside::math::add(center, broadside::math::scale(broadside::math::from_angle(angle(rng)), radius(rng)));
}

// Player on autopilot: long lazy turns with the trigger held.
broadside::ControlIntent scripted_player(float elapsed, bool launch) {
    broadside::ControlIntent intent;
    intent.thrust_forward = true;
    intent.fire = true;
    intent.turn_right = std::fmod(elapsed, 30.0f) < 6.0f;
    intent.launch_torpedo = launch;
    return intent;
}

struct Totals {
    std::size_t shots{0};
    std::size_t hits{0};
    std::size_t rams{0};
    std::size_t sunk{0};
};

void log_summary(const broadside::sim::Simulation& sim, const Totals& totals, float elapsed) {
    TraceLog(LOG_INFO, "[summary] t=%.0fs vessels=%zu autonomous=%zu projectiles=%zu shots=%zu hits=%zu rams=%zu sunk=%zu",
             elapsed, sim.vessel_count(), sim.autonomous_count(), sim.projectile_count(),
             totals.shots, totals.hits, totals.rams, totals.sunk);
}

} // namespace

int main(int argc, char* argv[]) {
    print_banner();

    Args args = parse_args(argc, argv);

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    auto& config = broadside::core::Config::instance();
    const bool loaded = config.load_from_file(args.config_path);

    broadside::core::LoggingConfig logging = config.logging();
    if (args.quiet) {
        logging.level = LOG_WARNING;
    } else if (args.verbose) {
        logging.level = LOG_DEBUG;
    }
    broadside::core::Logger::instance().init(logging);

    if (loaded) {
        TraceLog(LOG_INFO, "[config] loaded %s", args.config_path.c_str());
    } else {
        TraceLog(LOG_WARNING, "[config] %s not found, using defaults", args.config_path.c_str());
    }

    broadside::sim::SimulationConfig sim_config = broadside::sim::make_simulation_config(config.get());
    if (args.seed >= 0) sim_config.seed = static_cast<std::uint32_t>(args.seed);

    const float seconds = args.seconds >= 0.0f ? args.seconds : config.sim().seconds;
    const int raiders = args.raiders >= 0 ? args.raiders : config.sim().raiders;
    const int elites = args.elites >= 0 ? args.elites : config.sim().elites;

    broadside::sim::Simulation sim(sim_config);
    std::mt19937 spawn_rng(sim_config.seed);

    const Vector2 origin{0.0f, 0.0f};
    sim.spawn_player(origin, 0.0f);
    for (int i = 0; i < raiders; ++i) {
        const Vector2 at = annulus_point(spawn_rng, origin, kSpawnInner, kSpawnOuter);
        const float heading = broadside::math::angle_of(broadside::math::sub(origin, at));
        sim.spawn_autonomous(broadside::sim::raider_preset(), at, heading);
    }
    for (int i = 0; i < elites; ++i) {
        const Vector2 at = annulus_point(spawn_rng, origin, kEliteDistance, kEliteDistance);
        const float heading = broadside::math::angle_of(broadside::math::sub(origin, at));
        sim.spawn_elite(at, heading);
    }

    TraceLog(LOG_INFO, "[main] seed=%u raiders=%d elites=%d seconds=%.0f",
             sim_config.seed, raiders, elites, seconds);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Totals totals;
    float elapsed = 0.0f;
    float next_summary = kSummaryInterval;
    float next_torpedo = 0.0f;

    while (g_running && elapsed < seconds) {
        bool launch = false;
        if (elapsed >= next_torpedo) {
            launch = true;
            next_torpedo += kTorpedoInterval;
        }

        const auto report = sim.step(kTickDt, scripted_player(elapsed, launch));
        elapsed += kTickDt;

        totals.shots += report.shots_fired;
        totals.hits += report.hits.size();
        totals.rams += report.rams.size();
        totals.sunk += report.removed_vessels.size();

        if (elapsed >= next_summary) {
            log_summary(sim, totals, elapsed);
            next_summary += kSummaryInterval;
        }

        if (sim.player() == entt::null) {
            TraceLog(LOG_INFO, "[main] player lost after %.1fs", elapsed);
            break;
        }
        if (sim.autonomous_count() == 0 && raiders + elites > 0) {
            TraceLog(LOG_INFO, "[main] all hostiles sunk after %.1fs", elapsed);
            break;
        }
    }

    log_summary(sim, totals, elapsed);
    broadside::core::Logger::instance().shutdown();
    return 0;
}
