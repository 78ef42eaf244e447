#pragma once

#include <cstdint>

#include "render/RenderWorld.hpp"
#include "sim/Gesture.hpp"
#include "sim/Sim.hpp"
#include <raylib.h>

enum class GameScreen {
    MainMenu,
    Playing,
    Paused,
    GameOver,
};

struct Game {
    GameScreen screen = GameScreen::MainMenu;
    int menuSelection = 0;   // 0 = Start, 1 = Quit
    int pauseSelection = 0;  // 0 = Resume, 1 = Restart, 2 = Main menu
    bool wantsExit = false;

    SimulationState sim{};
    RenderWorld world{};
    GestureGate keyboardGate{};

    Camera3D camera{};
    uint32_t runSeed = 1u;
    uint32_t seedCounter = 0u;
    int bestScore = 0;
    int finalScore = 0;

    float damageFlashTimer = 0.0f;
    float presentationTime = 0.0f;  // wall time for cosmetic animation
    bool skipNextDelta = false;     // first frame after resume

    float updateMs = 0.0f;
    float renderMs = 0.0f;

    float screenshotNotificationTimer = 0.0f;
    char screenshotPath[256] = {};
    bool screenshotRequested = false;
};

void InitGame(Game& game, uint32_t seed);

// Resets every piece of session state before the next frame is simulated.
void StartRun(Game& game, uint32_t seed);
void PauseRun(Game& game);
void ResumeRun(Game& game);

// Keyboard -> gestures (through the cooldown gate) and menu navigation.
void ReadInput(Game& game);

// Steps the simulation for a Playing frame and forwards its events.
void UpdateGame(Game& game, float frameTime);

// Routes one frame's events: scene updates to the render world, damage to
// feedback, game over to the screen flow.
void HandleSimEvents(Game& game, const SimEventList& events);
