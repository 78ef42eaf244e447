#pragma once

struct Game;

void RenderFrame(const Game& game);
