#pragma once

// GL program objects and the compiler that builds them.
// Internal implementation - not part of public API.

#if SPRITEFX_HAS_GL

#include "spritefx/program.hpp"
#include <GL/glew.h>
#include <string>
#include <unordered_map>

namespace spritefx {

// Linked GL program with the locations of its active uniforms and attributes.
class GLProgram final : public Program {
public:
    explicit GLProgram(GLuint program);
    ~GLProgram() override;

    GLProgram(const GLProgram&) = delete;
    GLProgram& operator=(const GLProgram&) = delete;

    u64 handle() const override { return program_; }
    i32 uniformLocation(std::string_view name) const override;
    i32 attribLocation(std::string_view name) const override;

private:
    void collectLocations();

    GLuint program_ = 0;
    std::unordered_map<std::string, GLint> uniforms_;
    std::unordered_map<std::string, GLint> attribs_;
};

// Compiles and links against the current GL context.
class GLProgramCompiler final : public ProgramCompiler {
public:
    CompileResult compileAndLink(const std::string& vertexSource,
                                 const std::string& fragmentSource) override;

private:
    static GLuint compileShader(GLenum type, const std::string& src, ShaderError* error);
    static GLuint linkProgram(GLuint vert, GLuint frag, ShaderError* error);
};

} // namespace spritefx

#endif // SPRITEFX_HAS_GL
