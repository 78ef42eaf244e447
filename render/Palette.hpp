#pragma once

#include <raylib.h>

struct ScenePalette {
    Color skyTop{};
    Color skyHorizon{};
    Color sun{};
    Color cloud{};
    Color groundGrass{};
    Color trackMain{};
    Color trackStripe{};
    Color lavaCore{};
    Color lavaEmissive{};
    Color robotBody{};
    Color robotAccent{};
    Color robotMetal{};
    Color treeTrunk{};
    Color treeLeaves{};
    Color grassBlade{};
    Color flowerStem{};
    Color flowerRed{};
    Color flowerYellow{};
    Color uiPanel{};
    Color uiText{};
    Color uiAccent{};
    Color heartFull{};
    Color heartEmpty{};
    Color damageFlash{};
};

const ScenePalette& GetPalette();
