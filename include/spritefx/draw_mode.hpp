#pragma once

/**
 * @file draw_mode.hpp
 * @brief The closed set of rendering modes and what each one implies.
 */

#include "spritefx/types.hpp"
#include <array>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace spritefx {

class EffectRegistry;

/// @brief Rendering strategy selecting output transformation and discard rules.
enum class DrawMode : u8 {
    Default,        ///< Premultiplied-alpha draw.
    StraightAlpha,  ///< Un-premultiplied output, for pixel readback.
    Silhouette,     ///< Solid-color fill of covered pixels.
    ColorMask,      ///< Only pixels close to a target color survive.
    Line            ///< Antialiased capped line between two points.
};

constexpr u32 kDrawModeCount = 5;

/// @brief Symbol name of a draw mode ("default", "straightAlpha", ...).
/// Returns nullptr for values outside the enumeration.
const char* drawModeName(DrawMode mode);

/// @brief Description of one draw mode.
struct DrawModeInfo {
    DrawMode mode = DrawMode::Default;
    std::string name;                        ///< Emitted as DRAW_MODE_<name>.
    std::vector<std::string> ignoredEffects; ///< Effects this mode never renders.
    u32 ignoredMask = 0;                     ///< Resolved by the registry.

    bool discardTransparent = false;   ///< Fully transparent pixels are discarded.
    bool solidFill = false;            ///< Covered pixels take a caller-supplied color.
    bool colorDistanceDiscard = false; ///< Pixels far from a target color are discarded.
    bool unpremultiplyOutput = false;  ///< Output alpha is straight, not premultiplied.
    bool analyticLine = false;         ///< Geometry is generated from two pen points.
};

/**
 * @brief Immutable table of draw modes, one entry per DrawMode value.
 *
 * Ignored effects are resolved to a mask against an EffectRegistry when the
 * table is built, so normalizing a request is a single AND.
 */
class DrawModeRegistry {
public:
    /// @brief Build a registry covering every DrawMode exactly once.
    /// @return nullptr if a mode is missing or duplicated, if two modes share
    ///         a name, if a name is not a valid symbol (see isSymbolName), or
    ///         if an ignored effect is not registered in effects.
    static std::shared_ptr<const DrawModeRegistry> Make(std::vector<DrawModeInfo> modes,
                                                        const EffectRegistry& effects);

    /// @brief Build the standard table. Silhouette ignores color and brightness.
    static std::shared_ptr<const DrawModeRegistry> MakeDefault(const EffectRegistry& effects);

    /// @brief All modes in enumeration order.
    const std::array<DrawModeInfo, kDrawModeCount>& modes() const { return modes_; }

    /// @brief True if mode is one of the enumerated values.
    bool contains(DrawMode mode) const { return static_cast<u32>(mode) < kDrawModeCount; }

    /// @brief Info for a mode, or nullptr when out of range.
    const DrawModeInfo* info(DrawMode mode) const;

    /// @brief Look up a mode by symbol name. Returns nullptr when unknown.
    const DrawModeInfo* find(std::string_view name) const;

    /// @brief Effect bits the mode drops before lookup. 0 when out of range.
    u32 ignoredMask(DrawMode mode) const;

    /// @brief The effect registry the ignored masks were resolved against.
    /// Only meaningful for identity comparison; pair this table with that
    /// registry and no other.
    const EffectRegistry* effectRegistry() const { return effects_; }

    /// @brief Clear the bits the mode ignores.
    u32 normalize(DrawMode mode, u32 effectBits) const {
        return effectBits & ~ignoredMask(mode);
    }

private:
    DrawModeRegistry(std::array<DrawModeInfo, kDrawModeCount> modes,
                     const EffectRegistry* effects)
        : modes_(std::move(modes)), effects_(effects) {}

    std::array<DrawModeInfo, kDrawModeCount> modes_;
    const EffectRegistry* effects_ = nullptr;
};

} // namespace spritefx
