#include "spritefx/effect.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace spritefx {

namespace {
constexpr f64 kPi = 3.14159265358979323846;
}

namespace converters {

f64 color(f64 x) {
    return std::fmod(x / 200.0, 1.0);
}

f64 fisheye(f64 x) {
    return std::max(0.0, (x + 100.0) / 100.0);
}

f64 whirl(f64 x) {
    return -x * kPi / 180.0;
}

f64 pixelate(f64 x) {
    return std::fabs(x) / 10.0;
}

f64 mosaic(f64 x) {
    // Halves round up.
    f64 tiles = std::floor((std::fabs(x) + 10.0) / 10.0 + 0.5);
    return std::max(1.0, std::min(tiles, 512.0));
}

f64 brightness(f64 x) {
    return std::max(-100.0, std::min(x, 100.0)) / 100.0;
}

f64 ghost(f64 x) {
    return 1.0 - std::max(0.0, std::min(x, 100.0)) / 100.0;
}

} // namespace converters

bool isSymbolName(std::string_view name) {
    if (name.empty()) return false;
    for (char c : name) {
        const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                        (c >= '0' && c <= '9') || c == '_';
        if (!ok) return false;
    }
    return true;
}

EffectRegistry::EffectRegistry(std::vector<Effect> effects)
    : effects_(std::move(effects)) {
    for (u32 i = 0; i < effects_.size(); ++i) {
        effects_[i].bitPosition = i;
        allMask_ |= effects_[i].mask();
    }
}

std::shared_ptr<const EffectRegistry> EffectRegistry::Make(std::vector<Effect> effects) {
    if (effects.size() > kMaxEffects) {
        std::fprintf(stderr, "spritefx EffectRegistry: %zu effects exceeds the limit of %u\n",
                     effects.size(), kMaxEffects);
        return nullptr;
    }
    for (size_t i = 0; i < effects.size(); ++i) {
        const Effect& e = effects[i];
        if (e.name.empty() || !e.converter) {
            std::fprintf(stderr, "spritefx EffectRegistry: effect %zu is missing a name or converter\n", i);
            return nullptr;
        }
        if (!isSymbolName(e.name)) {
            std::fprintf(stderr, "spritefx EffectRegistry: effect name '%s' is not a valid symbol\n",
                         e.name.c_str());
            return nullptr;
        }
        for (size_t j = 0; j < i; ++j) {
            if (effects[j].name == e.name) {
                std::fprintf(stderr, "spritefx EffectRegistry: duplicate effect '%s'\n",
                             e.name.c_str());
                return nullptr;
            }
        }
    }
    return std::shared_ptr<const EffectRegistry>(new EffectRegistry(std::move(effects)));
}

std::shared_ptr<const EffectRegistry> EffectRegistry::MakeDefault() {
    std::vector<Effect> list;
    list.push_back({effects::kColor, "uColor", converters::color, false});
    list.push_back({effects::kFisheye, "uFisheye", converters::fisheye, true});
    list.push_back({effects::kWhirl, "uWhirl", converters::whirl, true});
    list.push_back({effects::kPixelate, "uPixelate", converters::pixelate, true});
    list.push_back({effects::kMosaic, "uMosaic", converters::mosaic, true});
    list.push_back({effects::kBrightness, "uBrightness", converters::brightness, false});
    list.push_back({effects::kGhost, "uGhost", converters::ghost, false});
    return Make(std::move(list));
}

const Effect* EffectRegistry::find(std::string_view name) const {
    for (const Effect& e : effects_) {
        if (e.name == name) return &e;
    }
    return nullptr;
}

u32 EffectRegistry::maskFor(std::string_view name) const {
    const Effect* e = find(name);
    return e ? e->mask() : 0;
}

bool EffectRegistry::convert(std::string_view name, f64 value, f64* out) const {
    const Effect* e = find(name);
    if (!e || !out) return false;
    *out = e->convert(value);
    return true;
}

} // namespace spritefx
