#include "render/Render.hpp"

#include <cmath>
#include <cstdio>

#include "core/Config.hpp"
#include "game/Game.hpp"
#include "render/Palette.hpp"
#include "render/RenderWorld.hpp"
#include "render/SceneDressing.hpp"
#include "rlgl.h"

namespace {

constexpr float kRadToDeg = 57.2957795f;

float Clamp01(const float value) {
    if (value < 0.0f) return 0.0f;
    if (value > 1.0f) return 1.0f;
    return value;
}

Color LerpColor(const Color a, const Color b, const float t) {
    const float k = Clamp01(t);
    return Color{
        static_cast<unsigned char>(a.r + (b.r - a.r) * k),
        static_cast<unsigned char>(a.g + (b.g - a.g) * k),
        static_cast<unsigned char>(a.b + (b.b - a.b) * k),
        static_cast<unsigned char>(a.a + (b.a - a.a) * k),
    };
}

// Local-space drawing helpers. Every model below is built from cubes around
// an origin at its feet, then placed with one transform push.
void BeginModel(const EntityTransform& t) {
    rlPushMatrix();
    rlTranslatef(t.x, t.y, t.z);
    rlRotatef(t.rotation * kRadToDeg, 0.0f, 1.0f, 0.0f);
    rlScalef(t.scale, t.scale, t.scale);
}

void EndModel() { rlPopMatrix(); }

// --- Lava block ---

void DrawLavaBlock(const ScenePalette& pal, const EntityTransform& t, const float time) {
    // Flowing glow stands in for the scrolling lava texture.
    const float flow = 0.5f + 0.5f * std::sin(time * 3.0f + t.z * 0.35f);
    const Color body = LerpColor(pal.lavaCore, pal.lavaEmissive, flow);
    const Vector3 size = Vector3{cfg::kLaneWidth * 0.8f, 1.0f, 1.0f};
    DrawCubeV(Vector3{t.x, t.y, t.z}, size, body);
    DrawCubeWiresV(Vector3{t.x, t.y, t.z}, size, Fade(pal.lavaEmissive, 0.8f));
}

// --- Scenery ---

void DrawTree(const ScenePalette& pal, const EntityTransform& t) {
    BeginModel(t);
    DrawCube(Vector3{0.0f, 1.5f, 0.0f}, 0.8f, 3.0f, 0.8f, pal.treeTrunk);
    DrawCube(Vector3{0.0f, 4.0f, 0.0f}, 3.0f, 2.4f, 3.0f, pal.treeLeaves);
    DrawCube(Vector3{0.0f, 5.6f, 0.0f}, 1.6f, 1.0f, 1.6f, pal.treeLeaves);
    EndModel();
}

void DrawGrassTuft(const ScenePalette& pal, const EntityTransform& t) {
    BeginModel(t);
    // Fixed blade layout; the spawn rotation varies it per tuft.
    static const Vector2 kBlades[] = {
        {-0.3f, 0.1f}, {0.2f, -0.25f}, {0.05f, 0.3f}, {0.35f, 0.15f}, {-0.15f, -0.3f},
    };
    for (const auto& b : kBlades) {
        DrawCube(Vector3{b.x, 0.3f, b.y}, 0.1f, 0.6f, 0.1f, pal.grassBlade);
    }
    EndModel();
}

void DrawFlower(const ScenePalette& pal, const EntityTransform& t, const EntityId id) {
    const Color head = (id % 2u == 0u) ? pal.flowerYellow : pal.flowerRed;
    BeginModel(t);
    DrawCube(Vector3{0.0f, 0.4f, 0.0f}, 0.08f, 0.8f, 0.08f, pal.flowerStem);
    DrawCube(Vector3{0.0f, 0.85f, 0.0f}, 0.3f, 0.3f, 0.3f, head);
    EndModel();
}

// --- Runner ---

void DrawLimb(const Vector3 pivot, const float angle, const Vector3 size, const Color col) {
    rlPushMatrix();
    rlTranslatef(pivot.x, pivot.y, pivot.z);
    rlRotatef(angle * kRadToDeg, 1.0f, 0.0f, 0.0f);
    DrawCube(Vector3{0.0f, -size.y * 0.5f, 0.0f}, size.x, size.y, size.z, col);
    rlPopMatrix();
}

void DrawRunner(const ScenePalette& pal, const EntityTransform& t, const PlayerPose& pose) {
    BeginModel(t);
    // Legs hang from the hips, arms from the shoulders.
    DrawLimb(Vector3{-0.25f, 1.0f, 0.0f}, pose.leftLeg, Vector3{0.3f, 1.0f, 0.3f}, pal.robotMetal);
    DrawLimb(Vector3{0.25f, 1.0f, 0.0f}, pose.rightLeg, Vector3{0.3f, 1.0f, 0.3f}, pal.robotMetal);
    DrawCube(Vector3{0.0f, 1.6f, 0.0f}, 0.9f, 1.2f, 0.5f, pal.robotBody);
    DrawLimb(Vector3{-0.6f, 2.1f, 0.0f}, pose.leftArm, Vector3{0.25f, 0.9f, 0.25f}, pal.robotAccent);
    DrawLimb(Vector3{0.6f, 2.1f, 0.0f}, pose.rightArm, Vector3{0.25f, 0.9f, 0.25f}, pal.robotAccent);
    DrawCube(Vector3{0.0f, 2.55f, 0.0f}, 0.7f, 0.7f, 0.7f, pal.robotMetal);
    DrawCube(Vector3{0.0f, 2.6f, -0.36f}, 0.5f, 0.15f, 0.02f, pal.robotBody);
    EndModel();
}

// --- HUD ---

void DrawHeart(const int x, const int y, const int size, const Color col, const bool filled) {
    const float r = size * 0.28f;
    const Vector2 left{static_cast<float>(x) - r, static_cast<float>(y)};
    const Vector2 right{static_cast<float>(x) + r, static_cast<float>(y)};
    const Vector2 tip{static_cast<float>(x), static_cast<float>(y) + size * 0.7f};
    if (filled) {
        DrawCircleV(left, r, col);
        DrawCircleV(right, r, col);
        DrawTriangle(Vector2{left.x - r, left.y + r * 0.3f}, tip, Vector2{right.x + r, right.y + r * 0.3f}, col);
    } else {
        DrawCircleLines(static_cast<int>(left.x), static_cast<int>(left.y), r, col);
        DrawCircleLines(static_cast<int>(right.x), static_cast<int>(right.y), r, col);
        DrawTriangleLines(Vector2{left.x - r, left.y + r * 0.3f}, tip, Vector2{right.x + r, right.y + r * 0.3f}, col);
    }
}

void RenderHud(const Game& game, const ScenePalette& pal) {
    const SimulationState& sim = game.sim;

    DrawRectangleRounded(Rectangle{16.0f, 16.0f, 230.0f, 74.0f}, 0.12f, 8, pal.uiPanel);
    char scoreText[64];
    std::snprintf(scoreText, sizeof(scoreText), "SCORE %d", sim.score);
    DrawText(scoreText, 30, 26, 28, pal.uiAccent);
    char speedText[64];
    std::snprintf(speedText, sizeof(speedText), "speed %.1f", sim.speed);
    DrawText(speedText, 30, 60, 16, pal.uiText);

    for (int life = 1; life <= cfg::kStartLives; ++life) {
        const bool full = life <= sim.lives;
        DrawHeart(cfg::kScreenWidth - 40 - (cfg::kStartLives - life) * 44, 34, 34,
                  full ? pal.heartFull : pal.heartEmpty, full);
    }
}

void RenderCenteredText(const char* text, const int y, const int size, const Color col) {
    const int w = MeasureText(text, size);
    DrawText(text, (cfg::kScreenWidth - w) / 2, y, size, col);
}

void RenderMenuItem(const char* text, const int y, const bool selected, const ScenePalette& pal) {
    RenderCenteredText(text, y, 26, selected ? pal.uiAccent : Fade(pal.uiText, 0.75f));
}

} // namespace

void RenderFrame(const Game& game) {
    const ScenePalette& pal = GetPalette();
    const float time = game.presentationTime;
    const int cy = cfg::kScreenHeight / 2;

    BeginDrawing();
    ClearBackground(pal.skyHorizon);
    render::RenderSky(pal);

    BeginMode3D(game.camera);
    render::RenderClouds(pal);
    render::RenderTrack(pal, static_cast<float>(game.sim.clockMs / 1000.0) * game.sim.speed);

    ForEachRenderEntity(game.world, [&](const RenderEntity& e) {
        if (!e.visible) return;
        switch (e.kind) {
            case EntityKind::Obstacle: DrawLavaBlock(pal, e.transform, time); break;
            case EntityKind::Tree:     DrawTree(pal, e.transform); break;
            case EntityKind::Grass:    DrawGrassTuft(pal, e.transform); break;
            case EntityKind::Flower:   DrawFlower(pal, e.transform, e.entityId); break;
            case EntityKind::Player:   DrawRunner(pal, e.transform, game.sim.player.pose); break;
        }
    });
    EndMode3D();

    if (game.damageFlashTimer > 0.0f) {
        const float a = Clamp01(game.damageFlashTimer / cfg::kDamageFlashDuration) * 0.35f;
        DrawRectangle(0, 0, cfg::kScreenWidth, cfg::kScreenHeight, Fade(pal.damageFlash, a));
    }

    if (game.screen == GameScreen::MainMenu) {
        DrawRectangle(0, 0, cfg::kScreenWidth, cfg::kScreenHeight, Fade(BLACK, 0.45f));
        RenderCenteredText("L A V A   L A N E S", cy - 120, 48, pal.uiAccent);
        RenderCenteredText("Switch lanes and jump over the lava", cy - 60, 20, pal.uiText);
        RenderMenuItem("Start", cy, game.menuSelection == 0, pal);
        RenderMenuItem("Quit", cy + 40, game.menuSelection == 1, pal);
        if (game.bestScore > 0) {
            char best[64];
            std::snprintf(best, sizeof(best), "Best: %d", game.bestScore);
            RenderCenteredText(best, cy + 110, 20, Fade(pal.uiText, 0.8f));
        }
        RenderCenteredText("LEFT/RIGHT or A/D to switch lanes, SPACE to jump", cfg::kScreenHeight - 50, 16,
                           Fade(pal.uiText, 0.7f));
    } else if (game.screen == GameScreen::Paused) {
        RenderHud(game, pal);
        DrawRectangle(0, 0, cfg::kScreenWidth, cfg::kScreenHeight, Fade(BLACK, 0.55f));
        RenderCenteredText("P A U S E D", cy - 100, 40, pal.uiAccent);
        RenderMenuItem("Resume", cy - 20, game.pauseSelection == 0, pal);
        RenderMenuItem("Restart", cy + 20, game.pauseSelection == 1, pal);
        RenderMenuItem("Main menu", cy + 60, game.pauseSelection == 2, pal);
    } else if (game.screen == GameScreen::GameOver) {
        DrawRectangle(0, 0, cfg::kScreenWidth, cfg::kScreenHeight, Fade(BLACK, 0.65f));
        RenderCenteredText("G A M E   O V E R", cy - 90, 40, pal.heartFull);
        char finalScore[64];
        std::snprintf(finalScore, sizeof(finalScore), "Score: %d", game.finalScore);
        RenderCenteredText(finalScore, cy - 20, 28, pal.uiText);
        char bestText[64];
        std::snprintf(bestText, sizeof(bestText), "Best: %d", game.bestScore);
        RenderCenteredText(bestText, cy + 16, 20, Fade(pal.uiAccent, 0.8f));
        RenderCenteredText("R  Play again", cy + 70, 18, pal.uiText);
        RenderCenteredText("ESC  Main menu", cy + 96, 18, Fade(pal.uiText, 0.7f));
    } else {
        RenderHud(game, pal);
    }

    // ---- Perf overlay (bottom-left) ----
    {
        const int perfY = cfg::kScreenHeight - 34;
        char perfBuf[128];
        std::snprintf(perfBuf, sizeof(perfBuf), "Update: %.2f ms  Render: %.2f ms  Entities: %d",
                      game.updateMs, game.renderMs, game.world.liveCount);
        DrawText(perfBuf, 12, perfY, 13, Fade(pal.uiText, 0.7f));
    }

    if (game.screenshotNotificationTimer > 0.0f) {
        const float alpha = Clamp01(game.screenshotNotificationTimer / 0.5f);
        const int notifW = 400;
        const int notifX = (cfg::kScreenWidth - notifW) / 2;
        DrawRectangleRounded(Rectangle{static_cast<float>(notifX), 60.0f, static_cast<float>(notifW), 50.0f},
                             0.1f, 8, Fade(pal.uiPanel, alpha * 0.95f));
        DrawText("Screenshot saved!", notifX + 20, 68, 20, Fade(pal.uiAccent, alpha));
        DrawText(game.screenshotPath, notifX + 20, 90, 14, Fade(pal.uiText, alpha * 0.8f));
    }

    EndDrawing();
}
