#pragma once

/**
 * @file effect_state.hpp
 * @brief Per-sprite effect magnitudes and the effect bits they imply.
 */

#include "spritefx/effect.hpp"
#include "spritefx/types.hpp"
#include <memory>
#include <string_view>
#include <vector>

namespace spritefx {

/**
 * @brief Application-level effect values for one sprite.
 *
 * An effect with a non-zero value is active and sets its bit in
 * effectBits(); the shader receives uniformValue() for it.
 */
class EffectState {
public:
    explicit EffectState(std::shared_ptr<const EffectRegistry> effects);

    /// @brief Set an effect's magnitude. Returns false if the effect is unknown.
    bool set(std::string_view name, f64 value);

    /// @brief Current magnitude of an effect, 0 if unknown.
    f64 value(std::string_view name) const;

    /// @brief Converted value for the effect at a registry index.
    f64 uniformValue(u32 index) const;

    /// @brief Mask of the effects with a non-zero value.
    u32 effectBits() const { return bits_; }

    /// @brief True if any active effect can change the drawn shape.
    bool shapeChanges() const;

    /// @brief Set every effect back to 0.
    void reset();

    const EffectRegistry& effects() const { return *effects_; }

private:
    std::shared_ptr<const EffectRegistry> effects_;
    std::vector<f64> values_;
    u32 bits_ = 0;
};

} // namespace spritefx
