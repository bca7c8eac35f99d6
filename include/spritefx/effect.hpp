#pragma once

/**
 * @file effect.hpp
 * @brief Per-sprite visual effects and the immutable registry describing them.
 */

#include "spritefx/types.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace spritefx {

/// @brief Maps an application-level magnitude to the value the shader expects.
using EffectConverter = f64 (*)(f64);

/// @brief One optional visual effect a sprite can enable.
struct Effect {
    std::string name;                    ///< Symbolic name, emitted as ENABLE_<name>.
    std::string uniformName;             ///< Uniform receiving the converted value.
    EffectConverter converter = nullptr; ///< Magnitude conversion.
    bool shapeChanges = false;           ///< True if the effect can change covered pixels.
    u32 bitPosition = 0;                 ///< Assigned by the registry from list order.

    /// @brief The bit representing this effect in an effect bitmask.
    u32 mask() const { return 1u << bitPosition; }

    /// @brief Convert an application-level magnitude for this effect.
    f64 convert(f64 value) const { return converter(value); }
};

/// Names of the effects in the default registry.
namespace effects {
constexpr const char* kColor = "color";
constexpr const char* kFisheye = "fisheye";
constexpr const char* kWhirl = "whirl";
constexpr const char* kPixelate = "pixelate";
constexpr const char* kMosaic = "mosaic";
constexpr const char* kBrightness = "brightness";
constexpr const char* kGhost = "ghost";
}

/// Converters used by the default registry. All are pure and total over f64.
namespace converters {
/// Hue shift: -100..100 maps to a fraction of the color wheel, sign preserved.
f64 color(f64 x);
/// Fisheye: 0 is neutral (exponent 1), never negative.
f64 fisheye(f64 x);
/// Whirl: degrees to radians, clockwise for positive input.
f64 whirl(f64 x);
/// Pixelate: pixel block size in skin texels.
f64 pixelate(f64 x);
/// Mosaic: tile count per axis in [1, 512].
f64 mosaic(f64 x);
/// Brightness: -100..100 to an additive offset in [-1, 1].
f64 brightness(f64 x);
/// Ghost: 0..100 to an alpha multiplier in [0, 1].
f64 ghost(f64 x);
}

/// @brief True if name is non-empty and only uses [A-Za-z0-9_], so it can
///        be appended to ENABLE_ / DRAW_MODE_ as a preprocessor symbol.
bool isSymbolName(std::string_view name);

/**
 * @brief Immutable, ordered table of the supported effects.
 *
 * Bit positions follow list order and double as part of the shader cache
 * key, so the table is fixed once built. Create one per process with
 * MakeDefault() and hand it to the components that need it; tests may build
 * smaller registries with Make().
 */
class EffectRegistry {
public:
    /// Upper bound on the number of effects; keeps per-mode variant tables small.
    static constexpr u32 kMaxEffects = 10;

    /// @brief Build a registry from an ordered effect list.
    /// @return nullptr on a duplicate name or one outside [A-Za-z0-9_],
    ///         a null converter, or more than kMaxEffects entries.
    static std::shared_ptr<const EffectRegistry> Make(std::vector<Effect> effects);

    /// @brief Build the standard seven-effect registry.
    static std::shared_ptr<const EffectRegistry> MakeDefault();

    const std::vector<Effect>& effects() const { return effects_; }
    u32 count() const { return static_cast<u32>(effects_.size()); }
    const Effect& at(u32 index) const { return effects_[index]; }

    /// @brief Look up an effect by name. Returns nullptr when unknown.
    const Effect* find(std::string_view name) const;

    /// @brief Mask of the named effect, or 0 when unknown.
    u32 maskFor(std::string_view name) const;

    /// @brief Union of every registered mask.
    u32 allMask() const { return allMask_; }

    /// @brief True if bits only contains registered effect masks.
    bool isValidMask(u32 bits) const { return (bits & ~allMask_) == 0; }

    /// @brief Convert a magnitude through the named effect's converter.
    /// @return False (and out untouched) when the effect is unknown.
    bool convert(std::string_view name, f64 value, f64* out) const;

private:
    explicit EffectRegistry(std::vector<Effect> effects);

    std::vector<Effect> effects_;
    u32 allMask_ = 0;
};

} // namespace spritefx
