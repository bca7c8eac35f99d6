#include "spritefx/program.hpp"

namespace spritefx {

const char* statusName(ShaderStatus status) {
    switch (status) {
        case ShaderStatus::Ok:                return "Ok";
        case ShaderStatus::InvalidDrawMode:   return "InvalidDrawMode";
        case ShaderStatus::InvalidEffectBits: return "InvalidEffectBits";
        case ShaderStatus::CompileFailed:     return "CompileFailed";
        case ShaderStatus::LinkFailed:        return "LinkFailed";
        case ShaderStatus::OutOfResources:    return "OutOfResources";
        case ShaderStatus::RegistryMismatch:  return "RegistryMismatch";
    }
    return "Unknown";
}

} // namespace spritefx
