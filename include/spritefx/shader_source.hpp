#pragma once

/**
 * @file shader_source.hpp
 * @brief Generation of shader source text for one (draw mode, effect bits) pair.
 */

#include "spritefx/draw_mode.hpp"
#include "spritefx/types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace spritefx {

class EffectRegistry;

/**
 * @brief Conditionally-compiled vertex and fragment template text.
 *
 * Regions are guarded by DRAW_MODE_<mode> and ENABLE_<effect> symbols;
 * undefined symbols disable their regions.
 */
struct ShaderTemplates {
    std::string versionLine; ///< Emitted before the define block, e.g. "#version 330 core".
    std::string vertex;
    std::string fragment;

    /// @brief GLSL 3.30 core templates for the default registries.
    static ShaderTemplates Default();
};

/// @brief Final source text for one shader variant.
struct ShaderSource {
    std::string defines;  ///< The #define block prepended to both stages.
    std::string vertex;
    std::string fragment;
};

/**
 * @brief Pure function from (draw mode, effect bits) to source text.
 *
 * Identical inputs always produce byte-identical output. The bits are used
 * as given; normalization per draw mode is the caller's job.
 */
class ShaderSourceBuilder {
public:
    ShaderSourceBuilder(std::shared_ptr<const EffectRegistry> effects,
                        std::shared_ptr<const DrawModeRegistry> drawModes,
                        ShaderTemplates templates);

    /// @brief Symbols to define: DRAW_MODE_<mode> first, then ENABLE_<effect>
    ///        for each set bit in bit order. Empty if mode is out of range.
    std::vector<std::string> symbols(DrawMode mode, u32 effectBits) const;

    /// @brief The define block: one "#define <symbol>" per line, newline-terminated.
    std::string defines(DrawMode mode, u32 effectBits) const;

    /// @brief Full vertex and fragment source.
    ShaderSource build(DrawMode mode, u32 effectBits) const;

private:
    std::string assemble(const std::string& definesText, const std::string& body) const;

    std::shared_ptr<const EffectRegistry> effects_;
    std::shared_ptr<const DrawModeRegistry> drawModes_;
    ShaderTemplates templates_;
};

} // namespace spritefx
