// sim_runner — headless lane-runner session driver
//
// Runs the simulation without a window. Gestures come from a deterministic
// bot or from a recorded JSON gesture script. Outputs structured metrics for
// balancing and regression testing.
//
// Usage:
//   sim_runner [options]
//     --seed <hex|dec>     Run seed (default: 0xC0FFEE, or the script's seed)
//     --seconds <s>        Simulated seconds to run (default: 120)
//     --fps <n>            Frames per simulated second (default: 60)
//     --jitter <0..1>      Random frame-time jitter fraction (default: 0)
//     --bot <style>        cautious|jumper|random|idle (default: cautious)
//     --script <file>      Replay a JSON gesture script instead of the bot
//     --json               Output as JSON instead of plain text
//     --quiet              Only output final summary line
//     -h, --help           Print usage

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include <nlohmann/json.hpp>

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "core/Rng.hpp"
#include "render/RenderWorld.hpp"
#include "sim/Bot.hpp"
#include "sim/GestureScript.hpp"
#include "sim/Sim.hpp"

namespace {

struct RunnerArgs {
    uint32_t seed = 0xC0FFEEu;
    bool seedGiven = false;
    float seconds = 120.0f;
    int fps = 60;
    float jitter = 0.0f;
    BotStyle botStyle = BotStyle::Cautious;
    std::string scriptPath;
    bool json = false;
    bool quiet = false;
    bool help = false;
    bool bad = false;
};

uint32_t ParseSeed(const char* str) {
    // Accept 0x prefix for hex, otherwise decimal.
    return static_cast<uint32_t>(std::strtoul(str, nullptr, 0));
}

RunnerArgs ParseArgs(int argc, char* argv[]) {
    RunnerArgs args{};
    for (int i = 1; i < argc; ++i) {
        if ((std::strcmp(argv[i], "--seed") == 0) && i + 1 < argc) {
            args.seed = ParseSeed(argv[++i]);
            args.seedGiven = true;
        } else if ((std::strcmp(argv[i], "--seconds") == 0) && i + 1 < argc) {
            args.seconds = static_cast<float>(std::atof(argv[++i]));
            if (args.seconds < 0.0f) args.seconds = 0.0f;
        } else if ((std::strcmp(argv[i], "--fps") == 0) && i + 1 < argc) {
            args.fps = std::atoi(argv[++i]);
            if (args.fps < 1) args.fps = 1;
            if (args.fps > 1000) args.fps = 1000;
        } else if ((std::strcmp(argv[i], "--jitter") == 0) && i + 1 < argc) {
            args.jitter = static_cast<float>(std::atof(argv[++i]));
            if (args.jitter < 0.0f) args.jitter = 0.0f;
            if (args.jitter > 1.0f) args.jitter = 1.0f;
        } else if ((std::strcmp(argv[i], "--bot") == 0) && i + 1 < argc) {
            if (!ParseBotStyle(argv[++i], args.botStyle)) {
                std::fprintf(stderr, "unknown bot style: %s\n", argv[i]);
                args.bad = true;
            }
        } else if ((std::strcmp(argv[i], "--script") == 0) && i + 1 < argc) {
            args.scriptPath = argv[++i];
        } else if (std::strcmp(argv[i], "--json") == 0) {
            args.json = true;
        } else if (std::strcmp(argv[i], "--quiet") == 0) {
            args.quiet = true;
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            args.help = true;
        } else {
            std::fprintf(stderr, "unknown argument: %s\n", argv[i]);
            args.bad = true;
        }
    }
    return args;
}

void PrintUsage() {
    std::printf(
        "sim_runner — headless lane-runner session driver\n"
        "\n"
        "Usage: sim_runner [options]\n"
        "  --seed <hex|dec>     Run seed (default: 0xC0FFEE)\n"
        "  --seconds <s>        Simulated seconds (default: 120)\n"
        "  --fps <n>            Frames per simulated second (default: 60)\n"
        "  --jitter <0..1>      Frame-time jitter fraction (default: 0)\n"
        "  --bot <style>        cautious|jumper|random|idle (default: cautious)\n"
        "  --script <file>      Replay a JSON gesture script\n"
        "  --json               Output as JSON\n"
        "  --quiet              Only final summary line\n"
        "  -h, --help           This message\n"
    );
}

struct EventTally {
    int spawned = 0;
    int moved = 0;
    int removed = 0;
    int visibility = 0;
    int damaged = 0;
};

void Tally(EventTally& tally, const SimEventList& events) {
    for (const auto& e : events) {
        switch (e.type) {
            case SimEventType::Spawned:           ++tally.spawned; break;
            case SimEventType::Moved:             ++tally.moved; break;
            case SimEventType::Removed:           ++tally.removed; break;
            case SimEventType::VisibilityChanged: ++tally.visibility; break;
            case SimEventType::Damaged:           ++tally.damaged; break;
            case SimEventType::GameOver:          break;
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    const RunnerArgs args = ParseArgs(argc, argv);
    if (args.help) {
        PrintUsage();
        return 0;
    }
    if (args.bad) {
        PrintUsage();
        return 2;
    }

    Log::Init(false);
    Log::SetLevel(args.quiet || args.json ? spdlog::level::warn : spdlog::level::info);

    GestureScript script{};
    const bool useScript = !args.scriptPath.empty();
    if (useScript && !LoadGestureScript(script, args.scriptPath.c_str())) {
        Log::Shutdown();
        return 2;
    }

    uint32_t seed = args.seed;
    if (useScript && script.hasSeed && !args.seedGiven) {
        seed = script.seed;
    }

    SimulationState sim{};
    ResetSimulation(sim, seed);

    // The render table is kept in step so handle pairing is checked on every
    // run, window or not.
    RenderWorld world{};
    ApplySimEvents(world, TakeEvents(sim));

    Bot bot{};
    InitBot(bot, args.botStyle, seed ^ 0x12345678u);
    uint32_t jitterRng = seed ^ 0x9E3779B9u;

    using Clock = std::chrono::steady_clock;
    const auto wallStart = Clock::now();

    const float baseDt = 1.0f / static_cast<float>(args.fps);
    const double endMs = static_cast<double>(args.seconds) * 1000.0;
    EventTally tally{};
    int frames = 0;

    while (sim.clockMs < endMs && !sim.gameOver) {
        if (useScript) {
            for (GestureSymbol g = PopDueGesture(script, sim.clockMs); g != GestureSymbol::None;
                 g = PopDueGesture(script, sim.clockMs)) {
                SubmitGesture(sim, g);
            }
        } else {
            const GestureSymbol g = BotDecide(bot, sim);
            if (g != GestureSymbol::None) SubmitGesture(sim, g);
        }

        float dt = baseDt;
        if (args.jitter > 0.0f) {
            dt *= 1.0f + core::NextRange(jitterRng, -args.jitter, args.jitter);
        }
        SimStep(sim, dt);
        ++frames;

        const SimEventList events = TakeEvents(sim);
        Tally(tally, events);
        ApplySimEvents(world, events);
    }

    const auto wallEnd = Clock::now();
    const float wallMs = std::chrono::duration<float, std::milli>(wallEnd - wallStart).count();

    // Every live entity plus the player must own exactly one render handle.
    const int expectedHandles = GetLiveEntityCount(sim.entities) + 1;
    const bool handlesPaired = (world.liveCount == expectedHandles) && (world.ignoredCommands == 0);
    const bool survived = !sim.gameOver;
    const float simSeconds = static_cast<float>(sim.clockMs / 1000.0);
    const float perfMsPer1k = (frames > 0) ? (wallMs / (static_cast<float>(frames) / 1000.0f)) : 0.0f;
    const char* driver = useScript ? "script" : GetBotStyleName(args.botStyle);

    if (args.json) {
        nlohmann::ordered_json out;
        char seedHex[16];
        std::snprintf(seedHex, sizeof(seedHex), "0x%08X", sim.seed);
        out["seed"] = seedHex;
        out["driver"] = driver;
        if (useScript) out["script"] = script.name;
        out["frames"] = frames;
        out["sim_time"] = simSeconds;
        out["score"] = sim.score;
        out["lives"] = sim.lives;
        out["speed"] = sim.speed;
        out["status"] = survived ? "SURVIVED" : "GAME_OVER";
        out["obstacles"] = {
            {"spawned", sim.stats.obstaclesSpawned},
            {"passed", sim.stats.obstaclesPassed},
            {"retired", sim.stats.obstaclesRetired},
            {"hits", sim.stats.hitsTaken},
        };
        out["decorations"] = {
            {"spawned", sim.stats.decorationsSpawned},
            {"retired", sim.stats.decorationsRetired},
        };
        out["events"] = {
            {"spawned", tally.spawned},
            {"moved", tally.moved},
            {"removed", tally.removed},
            {"visibility", tally.visibility},
            {"damaged", tally.damaged},
        };
        out["handles_paired"] = handlesPaired;
        out["wall_ms"] = wallMs;
        out["perf_ms_per_1k"] = perfMsPer1k;
        std::printf("%s\n", out.dump(2).c_str());
    } else if (args.quiet) {
        std::printf("seed=0x%08X  driver=%-8s  status=%-9s  score=%-6d  lives=%d  time=%-7.2fs  speed=%.2f  perf=%.3fms/1k\n",
                    sim.seed, driver, survived ? "SURVIVED" : "GAME_OVER",
                    sim.score, sim.lives, simSeconds, sim.speed, perfMsPer1k);
    } else {
        std::printf("=== Lane Runner Headless Sim Runner ===\n");
        std::printf("seed:        0x%08X\n", sim.seed);
        std::printf("driver:      %s\n", driver);
        std::printf("frames:      %d\n", frames);
        std::printf("sim_time:    %.2f s\n", simSeconds);
        std::printf("score:       %d\n", sim.score);
        std::printf("lives:       %d / %d\n", sim.lives, cfg::kStartLives);
        std::printf("speed:       %.2f / %.1f\n", sim.speed, cfg::kMaxSpeed);
        std::printf("obstacles:   %d spawned, %d passed, %d hits\n",
                    sim.stats.obstaclesSpawned, sim.stats.obstaclesPassed, sim.stats.hitsTaken);
        std::printf("decorations: %d spawned\n", sim.stats.decorationsSpawned);
        std::printf("handles:     %s (%d live)\n", handlesPaired ? "paired" : "LEAKED", world.liveCount);
        std::printf("status:      %s\n", survived ? "SURVIVED" : "GAME_OVER");
        std::printf("wall_time:   %.2f ms\n", wallMs);
        std::printf("perf:        %.3f ms / 1000 frames\n", perfMsPer1k);
    }

    Log::Shutdown();
    if (!handlesPaired) return 3;
    return survived ? 0 : 1;
}
