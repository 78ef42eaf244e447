#include "render/Palette.hpp"

namespace {
// Blocky daylight: sky blue over a grass field, stone lanes, lava blocks.
constexpr ScenePalette kPalette{
    /* skyTop       */ Color{135, 206, 235, 255},
    /* skyHorizon   */ Color{207, 239, 255, 255},
    /* sun          */ Color{255, 236, 140, 255},
    /* cloud        */ Color{255, 255, 255, 235},
    /* groundGrass  */ Color{92, 168, 62, 255},
    /* trackMain    */ Color{51, 51, 51, 255},
    /* trackStripe  */ Color{85, 85, 85, 255},
    /* lavaCore     */ Color{255, 0, 0, 255},
    /* lavaEmissive */ Color{255, 51, 0, 255},
    /* robotBody    */ Color{32, 178, 170, 255},
    /* robotAccent  */ Color{255, 170, 0, 255},
    /* robotMetal   */ Color{238, 238, 238, 255},
    /* treeTrunk    */ Color{110, 78, 46, 255},
    /* treeLeaves   */ Color{46, 125, 50, 255},
    /* grassBlade   */ Color{76, 175, 80, 255},
    /* flowerStem   */ Color{56, 142, 60, 255},
    /* flowerRed    */ Color{229, 57, 53, 255},
    /* flowerYellow */ Color{253, 216, 53, 255},
    /* uiPanel      */ Color{20, 20, 20, 170},
    /* uiText       */ Color{250, 250, 250, 255},
    /* uiAccent     */ Color{245, 184, 25, 255},
    /* heartFull    */ Color{239, 68, 68, 255},
    /* heartEmpty   */ Color{102, 102, 102, 255},
    /* damageFlash  */ Color{255, 30, 0, 255},
};
} // namespace

const ScenePalette& GetPalette() { return kPalette; }
