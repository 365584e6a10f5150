#pragma once

#include <cstdint>

#include <imgui.h>

#include "core/Types.hpp" // BlockColor

namespace blockblast::gui_sdl {

struct Palette {
    static ImU32 background()    { return IM_COL32( 26,  26,  46, 255); }
    static ImU32 gridBackground(){ return IM_COL32( 15,  15,  26, 255); }
    static ImU32 gridLine()      { return IM_COL32( 45,  58,  74, 255); }
    static ImU32 cellEmpty()     { return IM_COL32( 26,  26,  46, 255); }

    static ImU32 ghostValid()    { return IM_COL32(149, 231, 122, 102); }
    static ImU32 ghostInvalid()  { return IM_COL32(255, 107, 107, 102); }
    static ImU32 clearFlash()    { return IM_COL32(255, 255, 255, 255); }

    static ImU32 slotBackground(){ return IM_COL32( 30,  42,  58, 255); }
    static ImU32 overlay()       { return IM_COL32(  0,   0,   0, 178); }
};

// Vibrant block hues
inline ImU32 colorForBlock(blockblast::core::BlockColor color)
{
    using blockblast::core::BlockColor;
    switch (color) {
        case BlockColor::Red:    return IM_COL32(255, 107, 107, 255);
        case BlockColor::Blue:   return IM_COL32( 78, 205, 196, 255);
        case BlockColor::Green:  return IM_COL32(149, 231, 122, 255);
        case BlockColor::Yellow: return IM_COL32(255, 217,  61, 255);
        case BlockColor::Purple: return IM_COL32(165,  94, 234, 255);
        case BlockColor::Orange: return IM_COL32(255, 159,  67, 255);
    }
    return IM_COL32(200, 200, 200, 255);
}

inline void unpackImU32(ImU32 col, std::uint8_t& r, std::uint8_t& g, std::uint8_t& b, std::uint8_t& a)
{
    r = (col >> IM_COL32_R_SHIFT) & 0xFF;
    g = (col >> IM_COL32_G_SHIFT) & 0xFF;
    b = (col >> IM_COL32_B_SHIFT) & 0xFF;
    a = (col >> IM_COL32_A_SHIFT) & 0xFF;
}

} // namespace blockblast::gui_sdl
