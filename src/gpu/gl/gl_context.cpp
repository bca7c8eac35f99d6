// GL context factory - binds a GpuContext to the current OpenGL context.
//
// Only compiled when SPRITEFX_HAS_GL is defined (via CMake).
// Requires OpenGL 3.3+ core profile.

#include "spritefx/gpu/gl/gl_context.hpp"
#include "gl_program.hpp"

#if SPRITEFX_HAS_GL

#include <GL/glew.h>
#include <cstdio>

namespace spritefx {

namespace GpuContexts {

std::shared_ptr<GpuContext> MakeGL() {
    // GLEW requires this for core profiles and EGL environments.
    glewExperimental = GL_TRUE;
    const GLenum err = glewInit();
    // Clear any sticky errors introduced by glewInit.
    while (glGetError() != GL_NO_ERROR) {
    }

    if (err != GLEW_OK) {
        // EGL setups can report non-fatal GLEW init errors; keep going if GL is alive.
        if (glGetString(GL_VERSION) == nullptr) {
            std::fprintf(stderr, "spritefx GpuContext: GLEW init failed: %s\n",
                         reinterpret_cast<const char*>(glewGetErrorString(err)));
            return nullptr;
        }
    }

    if (glGetString(GL_VERSION) == nullptr) {
        std::fprintf(stderr, "spritefx GpuContext: no current GL context\n");
        return nullptr;
    }

    return GpuContext::MakeFromCompiler(std::make_shared<GLProgramCompiler>());
}

} // namespace GpuContexts

} // namespace spritefx

#endif // SPRITEFX_HAS_GL
