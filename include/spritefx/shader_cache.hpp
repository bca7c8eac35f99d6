#pragma once

/**
 * @file shader_cache.hpp
 * @brief Compile-on-demand cache of shader variants keyed by draw mode and effects.
 */

#include "spritefx/draw_mode.hpp"
#include "spritefx/effect.hpp"
#include "spritefx/program.hpp"
#include "spritefx/shader_source.hpp"
#include "spritefx/types.hpp"
#include <array>
#include <memory>
#include <vector>

namespace spritefx {

/**
 * @brief Maps (draw mode, effect bits) to a compiled program, building each
 *        variant at most once.
 *
 * Requested bits are first normalized by the draw mode (silhouette drops
 * color and brightness). Each draw mode owns a dense table of
 * 2^effectCount slots addressed by the normalized bits. Entries are never
 * evicted; failures are never stored, so a failed key is compiled again on
 * the next request.
 *
 * drawModes must have been built against effects. A cache given a table
 * resolved against another registry rejects every request with
 * RegistryMismatch.
 *
 * Not thread-safe: calls must come from the thread that owns the graphics
 * context.
 */
class ShaderCache {
public:
    ShaderCache(std::shared_ptr<const EffectRegistry> effects,
                std::shared_ptr<const DrawModeRegistry> drawModes,
                std::shared_ptr<ProgramCompiler> compiler,
                ShaderTemplates templates = ShaderTemplates::Default());
    ~ShaderCache();

    ShaderCache(const ShaderCache&) = delete;
    ShaderCache& operator=(const ShaderCache&) = delete;

    /**
     * @brief Fetch the program for a draw mode and effect set, compiling it
     *        on first use.
     * @param mode Draw mode; must be one of the enumerated values.
     * @param effectBits Union of registered effect masks.
     * @param error Optional; receives the failure status and driver log.
     * @return Program owned by this cache, or nullptr on failure.
     */
    const Program* getShader(DrawMode mode, u32 effectBits, ShaderError* error = nullptr);

    /// @brief The cached program for a request, without compiling. nullptr on miss.
    const Program* peek(DrawMode mode, u32 effectBits) const;

    /// @brief Number of compiled variants.
    size_t size() const { return size_; }

    /// @brief Number of addressable variants (modes * 2^effectCount).
    size_t capacity() const;

    const ShaderSourceBuilder& sourceBuilder() const { return builder_; }
    const EffectRegistry& effects() const { return *effects_; }
    const DrawModeRegistry& drawModes() const { return *drawModes_; }

private:
    using VariantTable = std::vector<std::unique_ptr<Program>>;

    bool validate(DrawMode mode, u32 effectBits, ShaderError* error) const;

    std::shared_ptr<const EffectRegistry> effects_;
    std::shared_ptr<const DrawModeRegistry> drawModes_;
    std::shared_ptr<ProgramCompiler> compiler_;
    ShaderSourceBuilder builder_;
    // Declared after compiler_ so programs are released first.
    std::array<VariantTable, kDrawModeCount> variants_;
    size_t size_ = 0;
};

} // namespace spritefx
