#pragma once

#include "spritefx/gpu/gpu_context.hpp"

// This header is only usable when SPRITEFX_HAS_GL is defined.
// Including it without GL support will cause a compile error.

#if !SPRITEFX_HAS_GL
#error "GL backend not available. Build with -DSPRITEFX_ENABLE_GL=ON"
#endif

namespace spritefx {

/**
 * GL-specific GpuContext factory functions.
 *
 * Usage:
 *   #include <spritefx/gpu/gl/gl_context.hpp>
 *   auto ctx = GpuContexts::MakeGL();
 *   const Program* p = ctx->shaders().getShader(DrawMode::Default, bits);
 */
namespace GpuContexts {

/**
 * Create a GpuContext bound to the currently active OpenGL context.
 * Host must have created and made current a GL 3.3+ context before calling.
 * Returns nullptr if no GL context is current or GL init fails.
 */
std::shared_ptr<GpuContext> MakeGL();

} // namespace GpuContexts

} // namespace spritefx
