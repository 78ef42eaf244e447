#include <chrono>
#include <cstdio>
#include <ctime>

#include <raylib.h>

#include "core/Config.hpp"
#include "core/CrashHandler.hpp"
#include "core/Log.hpp"
#include "game/Game.hpp"
#include "render/Render.hpp"

int main() {
  Log::Init();
  CrashHandler::Init();
  LOG_INFO("LaneRunner starting...");

  SetConfigFlags(FLAG_MSAA_4X_HINT | FLAG_VSYNC_HINT);
  InitWindow(cfg::kScreenWidth, cfg::kScreenHeight, "Lava Lanes");
  SetExitKey(
      0); // Disable raylib's default ESC=quit so we handle ESC ourselves.
  SetTargetFPS(60);

  Game game{};
  InitGame(game, static_cast<uint32_t>(std::time(nullptr)));

  using Clock = std::chrono::steady_clock;

  while (!WindowShouldClose() && !game.wantsExit) {
    ReadInput(game);

    // One variable step per displayed frame. A stall (window drag, debugger)
    // is clamped so it cannot teleport the world.
    float frameTime = GetFrameTime();
    if (frameTime > cfg::kMaxFrameTime) {
      frameTime = cfg::kMaxFrameTime;
    }

    const auto updateStart = Clock::now();
    UpdateGame(game, frameTime);
    const auto updateEnd = Clock::now();
    game.updateMs =
        std::chrono::duration<float, std::milli>(updateEnd - updateStart)
            .count();

#ifndef NDEBUG
    if (game.updateMs > 2.0f) {
      LOG_WARN("UpdateGame() took {:.3f} ms (> 2ms budget)", game.updateMs);
    }
#endif

    const auto renderStart = Clock::now();
    RenderFrame(game);
    const auto renderEnd = Clock::now();
    game.renderMs =
        std::chrono::duration<float, std::milli>(renderEnd - renderStart)
            .count();

    if (game.screenshotNotificationTimer > 0.0f) {
      game.screenshotNotificationTimer -= frameTime;
    }

    if (game.screenshotRequested) {
      std::time_t now = std::time(nullptr);
      std::tm *tm = std::localtime(&now);
      char filename[256];
      std::snprintf(filename, sizeof(filename),
                    "screenshot_%04d%02d%02d_%02d%02d%02d.png",
                    tm->tm_year + 1900, tm->tm_mon + 1, tm->tm_mday,
                    tm->tm_hour, tm->tm_min, tm->tm_sec);
      TakeScreenshot(filename);
      std::snprintf(game.screenshotPath, sizeof(game.screenshotPath), "%s",
                    filename);
      game.screenshotNotificationTimer = 3.0f;
      game.screenshotRequested = false;
      LOG_INFO("Saved {}", filename);
    }
  }

  LOG_INFO("LaneRunner shutting down (best score {})", game.bestScore);
  CloseWindow();
  Log::Shutdown();
  return 0;
}
