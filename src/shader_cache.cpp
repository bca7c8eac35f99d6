#include "spritefx/shader_cache.hpp"

#include <cstdio>
#include <string>

namespace spritefx {

ShaderCache::ShaderCache(std::shared_ptr<const EffectRegistry> effects,
                         std::shared_ptr<const DrawModeRegistry> drawModes,
                         std::shared_ptr<ProgramCompiler> compiler,
                         ShaderTemplates templates)
    : effects_(std::move(effects)),
      drawModes_(std::move(drawModes)),
      compiler_(std::move(compiler)),
      builder_(effects_, drawModes_, std::move(templates)) {
    const size_t slots = size_t(1) << effects_->count();
    for (VariantTable& table : variants_) {
        table.resize(slots);
    }
}

ShaderCache::~ShaderCache() = default;

size_t ShaderCache::capacity() const {
    return kDrawModeCount * (size_t(1) << effects_->count());
}

bool ShaderCache::validate(DrawMode mode, u32 effectBits, ShaderError* error) const {
    ShaderError failure;
    if (drawModes_->effectRegistry() != effects_.get()) {
        // Ignored masks would clear the wrong bits and merge distinct keys.
        failure.status = ShaderStatus::RegistryMismatch;
        failure.log = "draw modes were resolved against a different effect registry";
    } else if (!drawModes_->contains(mode)) {
        failure.status = ShaderStatus::InvalidDrawMode;
        failure.log = "draw mode " + std::to_string(static_cast<u32>(mode)) + " is not registered";
    } else if (!effects_->isValidMask(effectBits)) {
        failure.status = ShaderStatus::InvalidEffectBits;
        failure.log = "effect bits " + std::to_string(effectBits & ~effects_->allMask()) +
                      " are not registered";
    } else {
        return true;
    }

    std::fprintf(stderr, "spritefx ShaderCache: rejected request: %s\n", failure.log.c_str());
    if (error) *error = std::move(failure);
    return false;
}

const Program* ShaderCache::getShader(DrawMode mode, u32 effectBits, ShaderError* error) {
    if (!validate(mode, effectBits, error)) return nullptr;

    const u32 key = drawModes_->normalize(mode, effectBits);
    std::unique_ptr<Program>& slot = variants_[static_cast<u32>(mode)][key];
    if (slot) {
        if (error) *error = ShaderError();
        return slot.get();
    }

    ShaderSource src = builder_.build(mode, key);
    CompileResult result = compiler_->compileAndLink(src.vertex, src.fragment);
    if (!result.program) {
        if (result.error.ok()) {
            result.error.status = ShaderStatus::CompileFailed;
        }
        std::fprintf(stderr, "spritefx ShaderCache: failed to build %s/0x%x (%s): %s\n",
                     drawModeName(mode), key, statusName(result.error.status),
                     result.error.log.c_str());
        if (error) *error = std::move(result.error);
        return nullptr;
    }

    slot = std::move(result.program);
    ++size_;
    if (error) *error = ShaderError();
    return slot.get();
}

const Program* ShaderCache::peek(DrawMode mode, u32 effectBits) const {
    if (drawModes_->effectRegistry() != effects_.get()) return nullptr;
    if (!drawModes_->contains(mode) || !effects_->isValidMask(effectBits)) return nullptr;
    const u32 key = drawModes_->normalize(mode, effectBits);
    return variants_[static_cast<u32>(mode)][key].get();
}

} // namespace spritefx
