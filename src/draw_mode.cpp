#include "spritefx/draw_mode.hpp"
#include "spritefx/effect.hpp"

#include <cstdio>
#include <initializer_list>

namespace spritefx {

const char* drawModeName(DrawMode mode) {
    switch (mode) {
        case DrawMode::Default:       return "default";
        case DrawMode::StraightAlpha: return "straightAlpha";
        case DrawMode::Silhouette:    return "silhouette";
        case DrawMode::ColorMask:     return "colorMask";
        case DrawMode::Line:          return "line";
    }
    return nullptr;
}

std::shared_ptr<const DrawModeRegistry> DrawModeRegistry::Make(std::vector<DrawModeInfo> modes,
                                                               const EffectRegistry& effects) {
    std::array<DrawModeInfo, kDrawModeCount> table;
    std::array<bool, kDrawModeCount> seen{};

    for (DrawModeInfo& m : modes) {
        const u32 index = static_cast<u32>(m.mode);
        if (index >= kDrawModeCount) {
            std::fprintf(stderr, "spritefx DrawModeRegistry: draw mode %u out of range\n", index);
            return nullptr;
        }
        if (seen[index]) {
            std::fprintf(stderr, "spritefx DrawModeRegistry: duplicate draw mode '%s'\n",
                         m.name.c_str());
            return nullptr;
        }
        if (!isSymbolName(m.name)) {
            std::fprintf(stderr, "spritefx DrawModeRegistry: draw mode %u has invalid name '%s'\n",
                         index, m.name.c_str());
            return nullptr;
        }
        for (u32 i = 0; i < kDrawModeCount; ++i) {
            if (seen[i] && table[i].name == m.name) {
                std::fprintf(stderr, "spritefx DrawModeRegistry: duplicate draw mode name '%s'\n",
                             m.name.c_str());
                return nullptr;
            }
        }

        m.ignoredMask = 0;
        for (const std::string& effect : m.ignoredEffects) {
            const u32 mask = effects.maskFor(effect);
            if (mask == 0) {
                std::fprintf(stderr, "spritefx DrawModeRegistry: '%s' ignores unknown effect '%s'\n",
                             m.name.c_str(), effect.c_str());
                return nullptr;
            }
            m.ignoredMask |= mask;
        }

        seen[index] = true;
        table[index] = std::move(m);
    }

    for (u32 i = 0; i < kDrawModeCount; ++i) {
        if (!seen[i]) {
            std::fprintf(stderr, "spritefx DrawModeRegistry: missing draw mode '%s'\n",
                         drawModeName(static_cast<DrawMode>(i)));
            return nullptr;
        }
    }

    return std::shared_ptr<const DrawModeRegistry>(new DrawModeRegistry(std::move(table), &effects));
}

std::shared_ptr<const DrawModeRegistry> DrawModeRegistry::MakeDefault(const EffectRegistry& effects) {
    std::vector<DrawModeInfo> modes(kDrawModeCount);

    modes[0].mode = DrawMode::Default;
    modes[0].name = drawModeName(DrawMode::Default);

    modes[1].mode = DrawMode::StraightAlpha;
    modes[1].name = drawModeName(DrawMode::StraightAlpha);
    modes[1].unpremultiplyOutput = true;

    // Silhouette fills with a solid color after coverage is known, so hue
    // and brightness never reach the output. Registries without those
    // effects have nothing to ignore.
    modes[2].mode = DrawMode::Silhouette;
    modes[2].name = drawModeName(DrawMode::Silhouette);
    for (const char* name : {effects::kColor, effects::kBrightness}) {
        if (effects.find(name)) modes[2].ignoredEffects.push_back(name);
    }
    modes[2].discardTransparent = true;
    modes[2].solidFill = true;

    modes[3].mode = DrawMode::ColorMask;
    modes[3].name = drawModeName(DrawMode::ColorMask);
    modes[3].colorDistanceDiscard = true;

    modes[4].mode = DrawMode::Line;
    modes[4].name = drawModeName(DrawMode::Line);
    modes[4].analyticLine = true;

    return Make(std::move(modes), effects);
}

const DrawModeInfo* DrawModeRegistry::info(DrawMode mode) const {
    if (!contains(mode)) return nullptr;
    return &modes_[static_cast<u32>(mode)];
}

const DrawModeInfo* DrawModeRegistry::find(std::string_view name) const {
    for (const DrawModeInfo& m : modes_) {
        if (m.name == name) return &m;
    }
    return nullptr;
}

u32 DrawModeRegistry::ignoredMask(DrawMode mode) const {
    const DrawModeInfo* m = info(mode);
    return m ? m->ignoredMask : 0;
}

} // namespace spritefx
