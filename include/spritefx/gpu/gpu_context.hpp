#pragma once

#include "spritefx/draw_mode.hpp"
#include "spritefx/effect.hpp"
#include "spritefx/program.hpp"
#include "spritefx/shader_cache.hpp"
#include "spritefx/shader_source.hpp"
#include <memory>

namespace spritefx {

/**
 * GpuContext - Backend-agnostic graphics context for sprite shaders.
 *
 * Owns the program compiler and the shader variant cache together, so every
 * compiled program is released with the context. The registries are shared
 * and immutable.
 *
 * Create via:
 *   - GpuContexts::MakeGL()         (include spritefx/gpu/gl/gl_context.hpp)
 *   - GpuContext::MakeFromCompiler() for custom or test backends
 *
 * The caller must keep the backend's native context current while the
 * GpuContext is used and when it is destroyed.
 */
class GpuContext {
public:
    ~GpuContext();

    /**
     * Create a context around an existing compiler.
     * Null registries are replaced by the defaults. Returns nullptr if
     * compiler is null, if drawModes is given without effects, or if
     * drawModes was built against a registry other than effects.
     */
    static std::shared_ptr<GpuContext> MakeFromCompiler(
        std::shared_ptr<ProgramCompiler> compiler,
        std::shared_ptr<const EffectRegistry> effects = nullptr,
        std::shared_ptr<const DrawModeRegistry> drawModes = nullptr,
        ShaderTemplates templates = ShaderTemplates::Default());

    bool valid() const;

    /// Shader variant cache bound to this context.
    ShaderCache& shaders() { return *shaders_; }
    const ShaderCache& shaders() const { return *shaders_; }

    const std::shared_ptr<const EffectRegistry>& effects() const { return effects_; }
    const std::shared_ptr<const DrawModeRegistry>& drawModes() const { return drawModes_; }

private:
    GpuContext(std::shared_ptr<const EffectRegistry> effects,
               std::shared_ptr<const DrawModeRegistry> drawModes,
               std::unique_ptr<ShaderCache> shaders);

    std::shared_ptr<const EffectRegistry> effects_;
    std::shared_ptr<const DrawModeRegistry> drawModes_;
    std::unique_ptr<ShaderCache> shaders_;
};

} // namespace spritefx
