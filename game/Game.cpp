#include "game/Game.hpp"

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "render/SceneDressing.hpp"

#include <raylib.h>

namespace cfg {
KeyConfig keys{};
} // namespace cfg

namespace {

uint32_t NormalizeSeed(const uint32_t seed) { return (seed == 0) ? 1u : seed; }

uint32_t NextRunSeed(Game &game) {
    // Golden-ratio stride keeps successive runs visibly different.
    ++game.seedCounter;
    return NormalizeSeed(game.runSeed + game.seedCounter * 0x9E3779B9u);
}

double WallClockMs() { return GetTime() * 1000.0; }

void FinishRun(Game &game, const int score) {
    game.finalScore = score;
    if (score > game.bestScore) {
        game.bestScore = score;
        LOG_INFO("New best score: {}", score);
    }
    game.screen = GameScreen::GameOver;
}

} // namespace

void InitGame(Game &game, const uint32_t seed) {
    game.runSeed = NormalizeSeed(seed);
    game.seedCounter = 0u;

    game.camera.position = {0.0f, cfg::kCameraHeight, cfg::kCameraDistance};
    game.camera.target = {0.0f, 0.0f, -10.0f};
    game.camera.up = {0.0f, 1.0f, 0.0f};
    game.camera.fovy = cfg::kCameraFov;
    game.camera.projection = CAMERA_PERSPECTIVE;

    InitGestureGate(game.keyboardGate, cfg::kLaneChangeCooldownMs,
                    cfg::kJumpCooldownMs);
    render::InitSceneDressing(game.runSeed);
    game.screen = GameScreen::MainMenu;
    game.menuSelection = 0;
}

void StartRun(Game &game, const uint32_t seed) {
    game.runSeed = NormalizeSeed(seed);
    ResetSimulation(game.sim, game.runSeed);
    // The reset's Removed/Spawned events are applied now so no stale handle
    // survives into the first frame.
    HandleSimEvents(game, TakeEvents(game.sim));

    InitGestureGate(game.keyboardGate, cfg::kLaneChangeCooldownMs,
                    cfg::kJumpCooldownMs);
    render::InitSceneDressing(game.runSeed);
    game.damageFlashTimer = 0.0f;
    game.finalScore = 0;
    game.skipNextDelta = true;
    game.screen = GameScreen::Playing;
    LOG_INFO("Run started (seed 0x{:08X})", game.runSeed);
}

void PauseRun(Game &game) {
    if (game.screen != GameScreen::Playing) {
        return;
    }
    PauseSimulation(game.sim);
    game.screen = GameScreen::Paused;
    game.pauseSelection = 0;
}

void ResumeRun(Game &game) {
    if (game.screen != GameScreen::Paused) {
        return;
    }
    ResumeSimulation(game.sim);
    game.skipNextDelta = true;
    game.screen = GameScreen::Playing;
}

void ReadInput(Game &game) {
    const auto &k = cfg::keys;

    if (IsKeyPressed(k.screenshot)) {
        game.screenshotRequested = true;
    }

    if (game.screen == GameScreen::Playing) {
        GestureSymbol raw = GestureSymbol::None;
        if (IsKeyPressed(k.jump) || IsKeyPressed(k.jumpAlt))
            raw = GestureSymbol::Jump;
        else if (IsKeyPressed(k.left) || IsKeyPressed(k.leftAlt))
            raw = GestureSymbol::Left;
        else if (IsKeyPressed(k.right) || IsKeyPressed(k.rightAlt))
            raw = GestureSymbol::Right;

        const GestureSymbol gesture = FilterGesture(game.keyboardGate, raw, WallClockMs());
        if (gesture != GestureSymbol::None) {
            LOG_DEBUG("Keyboard gesture {}", GetGestureName(gesture));
            SubmitGesture(game.sim, gesture);
        }

        if (IsKeyPressed(k.pause) || IsKeyPressed(k.back)) {
            PauseRun(game);
        }
    } else if (game.screen == GameScreen::MainMenu) {
        if (IsKeyPressed(KEY_UP) || IsKeyPressed(KEY_DOWN))
            game.menuSelection = 1 - game.menuSelection;
        if (IsKeyPressed(k.confirm) || IsKeyPressed(k.jump)) {
            if (game.menuSelection == 0) {
                StartRun(game, NextRunSeed(game));
            } else {
                game.wantsExit = true;
            }
        }
        if (IsKeyPressed(k.back))
            game.wantsExit = true;
    } else if (game.screen == GameScreen::Paused) {
        if (IsKeyPressed(KEY_UP))
            game.pauseSelection = (game.pauseSelection + 2) % 3;
        if (IsKeyPressed(KEY_DOWN))
            game.pauseSelection = (game.pauseSelection + 1) % 3;
        if (IsKeyPressed(k.pause) || IsKeyPressed(k.back)) {
            ResumeRun(game);
        } else if (IsKeyPressed(k.confirm)) {
            if (game.pauseSelection == 0) {
                ResumeRun(game);
            } else if (game.pauseSelection == 1) {
                StartRun(game, NextRunSeed(game));
            } else {
                game.screen = GameScreen::MainMenu;
                game.menuSelection = 0;
            }
        }
    } else if (game.screen == GameScreen::GameOver) {
        if (IsKeyPressed(k.restart) || IsKeyPressed(k.confirm)) {
            StartRun(game, NextRunSeed(game));
        } else if (IsKeyPressed(k.back)) {
            game.screen = GameScreen::MainMenu;
            game.menuSelection = 0;
        }
    }
}

void UpdateGame(Game &game, const float frameTime) {
    game.presentationTime += frameTime;
    render::UpdateSceneDressing(frameTime);
    if (game.damageFlashTimer > 0.0f) {
        game.damageFlashTimer -= frameTime;
        if (game.damageFlashTimer < 0.0f)
            game.damageFlashTimer = 0.0f;
    }

    if (game.screen != GameScreen::Playing) {
        return;
    }

    // Re-baseline after a pause or restart so menu time never becomes
    // simulated travel.
    const float dt = game.skipNextDelta ? 0.0f : frameTime;
    game.skipNextDelta = false;

    SimStep(game.sim, dt);
    HandleSimEvents(game, TakeEvents(game.sim));
}

void HandleSimEvents(Game &game, const SimEventList &events) {
    ApplySimEvents(game.world, events);
    for (const auto &e : events) {
        if (e.type != SimEventType::Moved) {
            LOG_TRACE("{} {} #{}", GetSimEventTypeName(e.type),
                      GetEntityKindName(e.kind), e.id);
        }
        if (e.type == SimEventType::Damaged) {
            game.damageFlashTimer = cfg::kDamageFlashDuration;
            LOG_INFO("Ouch! {} lives left", e.lives);
        } else if (e.type == SimEventType::GameOver) {
            FinishRun(game, e.score);
        }
    }
    if (game.world.ignoredCommands > 0) {
        LOG_WARN("{} render commands targeted missing handles",
                 game.world.ignoredCommands);
        game.world.ignoredCommands = 0;
    }
}
