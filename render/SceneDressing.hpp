#pragma once

#include <cstdint>

struct ScenePalette;

namespace render {

// Re-seeds cloud placement; called when a run starts.
void InitSceneDressing(uint32_t seed);

// Cloud drift is presentation-only and keeps moving while paused.
void UpdateSceneDressing(float renderDt);

void RenderSky(const ScenePalette &pal);
void RenderClouds(const ScenePalette &pal);
void RenderTrack(const ScenePalette &pal, float scrollZ);

} // namespace render
