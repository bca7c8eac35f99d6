#include "spritefx/shader_source.hpp"
#include "spritefx/effect.hpp"

namespace spritefx {

ShaderSourceBuilder::ShaderSourceBuilder(std::shared_ptr<const EffectRegistry> effects,
                                         std::shared_ptr<const DrawModeRegistry> drawModes,
                                         ShaderTemplates templates)
    : effects_(std::move(effects)),
      drawModes_(std::move(drawModes)),
      templates_(std::move(templates)) {
}

std::vector<std::string> ShaderSourceBuilder::symbols(DrawMode mode, u32 effectBits) const {
    std::vector<std::string> result;
    const DrawModeInfo* info = drawModes_->info(mode);
    if (!info) return result;

    result.push_back("DRAW_MODE_" + info->name);
    for (const Effect& e : effects_->effects()) {
        if (effectBits & e.mask()) {
            result.push_back("ENABLE_" + e.name);
        }
    }
    return result;
}

std::string ShaderSourceBuilder::defines(DrawMode mode, u32 effectBits) const {
    std::string text;
    for (const std::string& symbol : symbols(mode, effectBits)) {
        text += "#define ";
        text += symbol;
        text += '\n';
    }
    return text;
}

ShaderSource ShaderSourceBuilder::build(DrawMode mode, u32 effectBits) const {
    ShaderSource src;
    src.defines = defines(mode, effectBits);
    src.vertex = assemble(src.defines, templates_.vertex);
    src.fragment = assemble(src.defines, templates_.fragment);
    return src;
}

std::string ShaderSourceBuilder::assemble(const std::string& definesText,
                                          const std::string& body) const {
    std::string text;
    text.reserve(templates_.versionLine.size() + definesText.size() + body.size() + 1);
    // #version must be the first line of a desktop GLSL shader.
    if (!templates_.versionLine.empty()) {
        text += templates_.versionLine;
        text += '\n';
    }
    text += definesText;
    text += body;
    return text;
}

} // namespace spritefx
