#pragma once

/**
 * @file program.hpp
 * @brief Compiled shader programs and the compiler interface that produces them.
 */

#include "spritefx/types.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace spritefx {

/// @brief Outcome of a shader request.
enum class ShaderStatus : u8 {
    Ok,
    InvalidDrawMode,    ///< Draw mode outside the registered enumeration.
    InvalidEffectBits,  ///< Bits outside the registered effect masks.
    CompileFailed,      ///< A stage was rejected by the driver.
    LinkFailed,         ///< The stages compiled but did not link.
    OutOfResources,     ///< The driver refused to create another object.
    RegistryMismatch    ///< Draw modes were resolved against another effect registry.
};

/// @brief Human-readable name of a status ("Ok", "CompileFailed", ...).
const char* statusName(ShaderStatus status);

/// @brief Failure details. log carries the driver diagnostic verbatim.
struct ShaderError {
    ShaderStatus status = ShaderStatus::Ok;
    std::string log;

    bool ok() const { return status == ShaderStatus::Ok; }
};

/**
 * @brief A linked, bindable GPU program.
 *
 * Owned by the shader cache of the graphics context that created it.
 */
class Program {
public:
    virtual ~Program() = default;

    /// @brief Backend-specific program handle (e.g. a GL program name).
    virtual u64 handle() const = 0;

    /// @brief Location of an active uniform, or -1.
    virtual i32 uniformLocation(std::string_view name) const = 0;

    /// @brief Location of an active vertex attribute, or -1.
    virtual i32 attribLocation(std::string_view name) const = 0;
};

/// @brief Result of ProgramCompiler::compileAndLink. program is null on failure.
struct CompileResult {
    std::unique_ptr<Program> program;
    ShaderError error;
};

/**
 * @brief Turns vertex and fragment source into a linked program.
 *
 * Implemented per graphics backend. Calls are synchronous and may stall
 * for the duration of a driver compile and link.
 */
class ProgramCompiler {
public:
    virtual ~ProgramCompiler() = default;

    virtual CompileResult compileAndLink(const std::string& vertexSource,
                                         const std::string& fragmentSource) = 0;
};

} // namespace spritefx
