#include "render/SceneDressing.hpp"

#include <cmath>

#include <raylib.h>

#include "core/Config.hpp"
#include "core/Rng.hpp"
#include "render/Palette.hpp"
#include "sim/SimTypes.hpp"

namespace render {

struct Cloud {
  Vector3 pos;
  Vector3 size;
};

static Cloud g_clouds[cfg::kCloudCount];

void InitSceneDressing(const uint32_t seed) {
  uint32_t rng = (seed == 0u) ? 1u : seed ^ 0x5bd1e995u;
  for (auto &c : g_clouds) {
    c.size = Vector3{core::NextRange(rng, 6.0f, 20.0f),
                     core::NextRange(rng, 2.0f, 4.0f),
                     core::NextRange(rng, 4.0f, 14.0f)};
    c.pos = Vector3{core::NextRange(rng, -cfg::kCloudWrapX, cfg::kCloudWrapX),
                    core::NextRange(rng, 20.0f, 60.0f),
                    core::NextRange(rng, -140.0f, 10.0f)};
  }
}

void UpdateSceneDressing(const float renderDt) {
  for (auto &c : g_clouds) {
    c.pos.x += cfg::kCloudDriftSpeed * renderDt;
    if (c.pos.x > cfg::kCloudWrapX) {
      c.pos.x = -cfg::kCloudWrapX;
    }
  }
}

void RenderSky(const ScenePalette &pal) {
  DrawRectangleGradientV(0, 0, cfg::kScreenWidth, cfg::kScreenHeight,
                         pal.skyTop, pal.skyHorizon);
  DrawCircle(cfg::kScreenWidth - 180, 110, 46.0f, pal.sun);
  DrawCircleLines(cfg::kScreenWidth - 180, 110, 54.0f, Fade(pal.sun, 0.4f));
}

void RenderClouds(const ScenePalette &pal) {
  for (const auto &c : g_clouds) {
    DrawCubeV(c.pos, c.size, pal.cloud);
  }
}

void RenderTrack(const ScenePalette &pal, const float scrollZ) {
  // Grass field.
  DrawPlane(Vector3{0.0f, -0.02f, cfg::kTrackCenterZ},
            Vector2{cfg::kTrackLength * 2.0f, cfg::kTrackLength},
            pal.groundGrass);

  // One stone strip per lane, slightly narrower than the lane.
  const float stripWidth = cfg::kLaneWidth - 0.4f;
  for (int lane = kLaneLeft; lane <= kLaneRight; ++lane) {
    DrawPlane(Vector3{LaneToX(lane), 0.0f, cfg::kTrackCenterZ},
              Vector2{stripWidth, cfg::kTrackLength}, pal.trackMain);
  }

  // Cross stripes scroll with the world so speed reads on screen.
  constexpr float kStripeSpacing = 4.0f;
  const float offset = std::fmod(scrollZ, kStripeSpacing);
  const float halfWidth = cfg::kLaneWidth * 1.5f;
  for (float z = cfg::kSpawnDistance; z < cfg::kObstacleRetireZ;
       z += kStripeSpacing) {
    const float zz = z + offset;
    DrawLine3D(Vector3{-halfWidth, 0.01f, zz}, Vector3{halfWidth, 0.01f, zz},
               pal.trackStripe);
  }
}

} // namespace render
