// GpuContext - Ties a backend compiler to a shader variant cache.
//
// This file is always compiled. No backend-specific code.

#include "spritefx/gpu/gpu_context.hpp"

#include <cstdio>

namespace spritefx {

GpuContext::GpuContext(std::shared_ptr<const EffectRegistry> effects,
                       std::shared_ptr<const DrawModeRegistry> drawModes,
                       std::unique_ptr<ShaderCache> shaders)
    : effects_(std::move(effects)),
      drawModes_(std::move(drawModes)),
      shaders_(std::move(shaders)) {
}

GpuContext::~GpuContext() = default;

bool GpuContext::valid() const {
    return effects_ && drawModes_ && shaders_;
}

std::shared_ptr<GpuContext> GpuContext::MakeFromCompiler(
    std::shared_ptr<ProgramCompiler> compiler,
    std::shared_ptr<const EffectRegistry> effects,
    std::shared_ptr<const DrawModeRegistry> drawModes,
    ShaderTemplates templates) {
    if (!compiler) return nullptr;

    if (!effects) {
        if (drawModes) {
            std::fprintf(stderr, "spritefx GpuContext: draw modes given without their effect registry\n");
            return nullptr;
        }
        effects = EffectRegistry::MakeDefault();
        if (!effects) return nullptr;
    }
    if (!drawModes) {
        drawModes = DrawModeRegistry::MakeDefault(*effects);
        if (!drawModes) return nullptr;
    } else if (drawModes->effectRegistry() != effects.get()) {
        std::fprintf(stderr, "spritefx GpuContext: draw modes were resolved against a different effect registry\n");
        return nullptr;
    }

    auto shaders = std::make_unique<ShaderCache>(effects, drawModes, std::move(compiler),
                                                 std::move(templates));
    return std::shared_ptr<GpuContext>(
        new GpuContext(std::move(effects), std::move(drawModes), std::move(shaders)));
}

} // namespace spritefx
