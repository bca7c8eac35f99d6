#pragma once

/**
 * spritefx - Shader variants for 2D sprite effects
 *
 * Usage:
 *
 *   #include <spritefx/spritefx.hpp>
 *   auto ctx = spritefx::GpuContexts::MakeGL();   // GL context must be current
 *
 *   spritefx::EffectState state(ctx->effects());
 *   state.set("whirl", 45);
 *
 *   spritefx::ShaderError error;
 *   const spritefx::Program* program =
 *       ctx->shaders().getShader(spritefx::DrawMode::Default, state.effectBits(), &error);
 */

// Version
#include "spritefx/version.hpp"

// Core types
#include "spritefx/types.hpp"

// Registries
#include "spritefx/effect.hpp"
#include "spritefx/draw_mode.hpp"
#include "spritefx/effect_state.hpp"

// Source generation and compiled programs
#include "spritefx/shader_source.hpp"
#include "spritefx/program.hpp"
#include "spritefx/shader_cache.hpp"

// GPU context (abstract)
#include "spritefx/gpu/gpu_context.hpp"

// GL context factory (conditional - include <spritefx/gpu/gl/gl_context.hpp> explicitly)
#if SPRITEFX_HAS_GL
#include "spritefx/gpu/gl/gl_context.hpp"
#endif
