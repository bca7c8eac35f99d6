// GLProgram / GLProgramCompiler - OpenGL implementation of the program
// compiler interface.
//
// Only compiled when SPRITEFX_HAS_GL is defined (via CMake).

#include "gl_program.hpp"

#if SPRITEFX_HAS_GL

#include <cstdio>
#include <vector>

namespace spritefx {

namespace {

std::string shaderInfoLog(GLuint shader) {
    GLint length = 0;
    glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &length);
    if (length <= 1) return std::string();
    std::vector<char> log(static_cast<size_t>(length));
    glGetShaderInfoLog(shader, length, nullptr, log.data());
    return std::string(log.data());
}

std::string programInfoLog(GLuint program) {
    GLint length = 0;
    glGetProgramiv(program, GL_INFO_LOG_LENGTH, &length);
    if (length <= 1) return std::string();
    std::vector<char> log(static_cast<size_t>(length));
    glGetProgramInfoLog(program, length, nullptr, log.data());
    return std::string(log.data());
}

} // namespace

GLProgram::GLProgram(GLuint program) : program_(program) {
    collectLocations();
}

GLProgram::~GLProgram() {
    if (program_) { glDeleteProgram(program_); program_ = 0; }
}

i32 GLProgram::uniformLocation(std::string_view name) const {
    auto it = uniforms_.find(std::string(name));
    return it != uniforms_.end() ? it->second : -1;
}

i32 GLProgram::attribLocation(std::string_view name) const {
    auto it = attribs_.find(std::string(name));
    return it != attribs_.end() ? it->second : -1;
}

void GLProgram::collectLocations() {
    GLint maxLength = 0;
    GLint count = 0;

    glGetProgramiv(program_, GL_ACTIVE_UNIFORM_MAX_LENGTH, &maxLength);
    glGetProgramiv(program_, GL_ACTIVE_UNIFORMS, &count);
    std::vector<char> name(static_cast<size_t>(maxLength > 0 ? maxLength : 1));
    for (GLint i = 0; i < count; ++i) {
        GLsizei length = 0;
        GLint size = 0;
        GLenum type = 0;
        glGetActiveUniform(program_, GLuint(i), GLsizei(name.size()), &length, &size, &type, name.data());
        std::string uniform(name.data(), size_t(length));
        // Arrays report "name[0]"; index them by the bare name.
        const size_t bracket = uniform.find('[');
        if (bracket != std::string::npos) uniform.resize(bracket);
        uniforms_[uniform] = glGetUniformLocation(program_, name.data());
    }

    maxLength = 0;
    count = 0;
    glGetProgramiv(program_, GL_ACTIVE_ATTRIBUTE_MAX_LENGTH, &maxLength);
    glGetProgramiv(program_, GL_ACTIVE_ATTRIBUTES, &count);
    name.assign(static_cast<size_t>(maxLength > 0 ? maxLength : 1), '\0');
    for (GLint i = 0; i < count; ++i) {
        GLsizei length = 0;
        GLint size = 0;
        GLenum type = 0;
        glGetActiveAttrib(program_, GLuint(i), GLsizei(name.size()), &length, &size, &type, name.data());
        attribs_[std::string(name.data(), size_t(length))] = glGetAttribLocation(program_, name.data());
    }
}

CompileResult GLProgramCompiler::compileAndLink(const std::string& vertexSource,
                                                const std::string& fragmentSource) {
    CompileResult result;

    GLuint vert = compileShader(GL_VERTEX_SHADER, vertexSource, &result.error);
    if (!vert) return result;

    GLuint frag = compileShader(GL_FRAGMENT_SHADER, fragmentSource, &result.error);
    if (!frag) {
        glDeleteShader(vert);
        return result;
    }

    GLuint prog = linkProgram(vert, frag, &result.error);
    glDeleteShader(vert);
    glDeleteShader(frag);
    if (!prog) return result;

    result.program = std::make_unique<GLProgram>(prog);
    return result;
}

GLuint GLProgramCompiler::compileShader(GLenum type, const std::string& src, ShaderError* error) {
    GLuint shader = glCreateShader(type);
    if (!shader) {
        error->status = ShaderStatus::OutOfResources;
        error->log = "glCreateShader returned 0";
        std::fprintf(stderr, "spritefx GL: %s\n", error->log.c_str());
        return 0;
    }

    const char* text = src.c_str();
    glShaderSource(shader, 1, &text, nullptr);
    glCompileShader(shader);

    GLint ok = 0;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &ok);
    if (!ok) {
        error->status = ShaderStatus::CompileFailed;
        error->log = shaderInfoLog(shader);
        std::fprintf(stderr, "spritefx GL: %s shader error: %s\n",
                     type == GL_VERTEX_SHADER ? "vertex" : "fragment", error->log.c_str());
        glDeleteShader(shader);
        return 0;
    }
    return shader;
}

GLuint GLProgramCompiler::linkProgram(GLuint vert, GLuint frag, ShaderError* error) {
    GLuint prog = glCreateProgram();
    if (!prog) {
        error->status = ShaderStatus::OutOfResources;
        error->log = "glCreateProgram returned 0";
        std::fprintf(stderr, "spritefx GL: %s\n", error->log.c_str());
        return 0;
    }

    glAttachShader(prog, vert);
    glAttachShader(prog, frag);
    glLinkProgram(prog);

    GLint ok = 0;
    glGetProgramiv(prog, GL_LINK_STATUS, &ok);
    if (!ok) {
        error->status = ShaderStatus::LinkFailed;
        error->log = programInfoLog(prog);
        std::fprintf(stderr, "spritefx GL: link error: %s\n", error->log.c_str());
        glDeleteProgram(prog);
        return 0;
    }

    glDetachShader(prog, vert);
    glDetachShader(prog, frag);
    return prog;
}

} // namespace spritefx

#endif // SPRITEFX_HAS_GL
