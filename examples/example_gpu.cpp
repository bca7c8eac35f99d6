/**
 * example_gpu.cpp - Sprite effects with spritefx, displayed via SDL2
 *
 * Demonstrates:
 *   - Creating GpuContext via GpuContexts::MakeGL()
 *   - Driving effect bits from an EffectState
 *   - Fetching shader variants per draw mode and binding effect uniforms
 *
 * Keys: 1-4 switch draw mode (default, straightAlpha, silhouette, colorMask),
 *       L toggles the line overlay, ESC quits.
 *
 * Build:
 *   cmake -B build -DSPRITEFX_BUILD_EXAMPLES=ON -DSPRITEFX_ENABLE_GL=ON && cmake --build build
 *   ./build/example_gpu
 */

#include <spritefx/spritefx.hpp>
#include <spritefx/gpu/gl/gl_context.hpp>

#include <GL/glew.h>
#include <SDL2/SDL.h>

#include <cmath>
#include <cstdio>
#include <cstring>
#include <vector>

using namespace spritefx;

static const int W = 600, H = 400;
static const int kSkinSize = 64;

static GLuint makeCheckerSkin() {
    std::vector<u8> pixels(kSkinSize * kSkinSize * 4);
    for (int y = 0; y < kSkinSize; ++y) {
        for (int x = 0; x < kSkinSize; ++x) {
            u8* p = &pixels[(y * kSkinSize + x) * 4];
            const bool dark = ((x / 8) + (y / 8)) % 2 == 0;
            p[0] = dark ? 230 : 40;
            p[1] = dark ? 120 : 180;
            p[2] = dark ? 40 : 230;
            p[3] = 255;
        }
    }
    GLuint tex = 0;
    glGenTextures(1, &tex);
    glBindTexture(GL_TEXTURE_2D, tex);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, kSkinSize, kSkinSize, 0,
                 GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    return tex;
}

static void makeOrthoMatrix(float* m, float w, float h) {
    // Column-major orthographic projection: (0,0) top-left, (w,h) bottom-right
    std::memset(m, 0, 16 * sizeof(float));
    m[0]  =  2.0f / w;
    m[5]  = -2.0f / h;
    m[10] = -1.0f;
    m[12] = -1.0f;
    m[13] =  1.0f;
    m[15] =  1.0f;
}

static void makeModelMatrix(float* m, float x, float y, float size) {
    std::memset(m, 0, 16 * sizeof(float));
    m[0] = size;
    m[5] = size;
    m[10] = 1.0f;
    m[12] = x;
    m[13] = y;
    m[15] = 1.0f;
}

static void bindEffectUniforms(const Program* program, const EffectState& state) {
    const EffectRegistry& effects = state.effects();
    for (u32 i = 0; i < effects.count(); ++i) {
        const i32 loc = program->uniformLocation(effects.at(i).uniformName);
        if (loc >= 0) glUniform1f(loc, float(state.uniformValue(i)));
    }
    const i32 skinSize = program->uniformLocation("uSkinSize");
    if (skinSize >= 0) glUniform2f(skinSize, float(kSkinSize), float(kSkinSize));
}

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        std::printf("SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);

    SDL_Window* window = SDL_CreateWindow(
        "spritefx - sprite effects (OpenGL)",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        W, H,
        SDL_WINDOW_SHOWN | SDL_WINDOW_OPENGL
    );
    if (!window) {
        std::printf("SDL_CreateWindow failed: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext glContext = SDL_GL_CreateContext(window);
    if (!glContext) {
        std::printf("SDL_GL_CreateContext failed: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    // ---- Create spritefx GpuContext ----
    auto gpuContext = GpuContexts::MakeGL();
    if (!gpuContext) {
        std::printf("Failed to create spritefx GpuContext\n");
        SDL_GL_DeleteContext(glContext);
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    GLuint skin = makeCheckerSkin();

    // Unit quad, two triangles: position (2 float) + uv (2 float)
    const float quad[] = {
        0, 0, 0, 0,  1, 0, 1, 0,  0, 1, 0, 1,
        1, 0, 1, 0,  1, 1, 1, 1,  0, 1, 0, 1,
    };
    GLuint vao = 0, vbo = 0;
    glGenVertexArrays(1, &vao);
    glGenBuffers(1, &vbo);
    glBindVertexArray(vao);
    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    glBufferData(GL_ARRAY_BUFFER, sizeof(quad), quad, GL_STATIC_DRAW);
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, 4 * sizeof(float), (void*)0);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, 4 * sizeof(float), (void*)(2 * sizeof(float)));
    glEnableVertexAttribArray(1);
    glBindVertexArray(0);

    EffectState state(gpuContext->effects());
    DrawMode mode = DrawMode::Default;
    bool showLine = true;

    std::printf("spritefx sprite effects with OpenGL + SDL2 display\n");
    std::printf("Keys 1-4 switch draw mode, L toggles line, ESC quits\n");

    float projection[16];
    float model[16];
    makeOrthoMatrix(projection, float(W), float(H));

    bool running = true;
    float t = 0.0f;
    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            if (event.type == SDL_QUIT) running = false;
            if (event.type != SDL_KEYDOWN) continue;
            switch (event.key.keysym.sym) {
                case SDLK_ESCAPE: running = false; break;
                case SDLK_1: mode = DrawMode::Default; break;
                case SDLK_2: mode = DrawMode::StraightAlpha; break;
                case SDLK_3: mode = DrawMode::Silhouette; break;
                case SDLK_4: mode = DrawMode::ColorMask; break;
                case SDLK_l: showLine = !showLine; break;
                default: break;
            }
        }

        t += 0.02f;
        state.set(effects::kWhirl, std::sin(t) * 180.0);
        state.set(effects::kColor, std::fmod(t * 20.0, 200.0));
        state.set(effects::kPixelate, std::fabs(std::sin(t * 0.5)) * 40.0);

        glViewport(0, 0, W, H);
        glClearColor(20 / 255.0f, 25 / 255.0f, 35 / 255.0f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        glEnable(GL_BLEND);
        glBlendFunc(GL_ONE, GL_ONE_MINUS_SRC_ALPHA);

        ShaderError error;
        const Program* sprite = gpuContext->shaders().getShader(mode, state.effectBits(), &error);
        if (sprite) {
            glUseProgram(GLuint(sprite->handle()));
            glUniformMatrix4fv(sprite->uniformLocation("uProjectionMatrix"), 1, GL_FALSE, projection);
            makeModelMatrix(model, W / 2.0f - 128.0f, H / 2.0f - 128.0f, 256.0f);
            glUniformMatrix4fv(sprite->uniformLocation("uModelMatrix"), 1, GL_FALSE, model);
            glActiveTexture(GL_TEXTURE0);
            glBindTexture(GL_TEXTURE_2D, skin);
            glUniform1i(sprite->uniformLocation("uSkin"), 0);
            bindEffectUniforms(sprite, state);

            const DrawModeInfo* info = gpuContext->drawModes()->info(mode);
            if (info->solidFill) {
                glUniform4f(sprite->uniformLocation("uSilhouetteColor"), 1.0f, 1.0f, 1.0f, 1.0f);
            }
            if (info->colorDistanceDiscard) {
                glUniform3f(sprite->uniformLocation("uColorMask"), 230 / 255.0f, 120 / 255.0f, 40 / 255.0f);
                glUniform1f(sprite->uniformLocation("uColorMaskTolerance"), 0.2f);
            }

            glBindVertexArray(vao);
            glDrawArrays(GL_TRIANGLES, 0, 6);
        } else {
            std::printf("sprite shader unavailable (%s): %s\n",
                        statusName(error.status), error.log.c_str());
            running = false;
        }

        if (showLine) {
            const Program* line = gpuContext->shaders().getShader(DrawMode::Line, 0, &error);
            if (line) {
                glUseProgram(GLuint(line->handle()));
                glUniform2f(line->uniformLocation("uStageSize"), float(W), float(H));
                glUniform1f(line->uniformLocation("uLineThickness"), 6.0f);
                glUniform4f(line->uniformLocation("uPenPoints"),
                            -200.0f, std::sin(t) * 120.0f, 200.0f, -std::sin(t) * 120.0f);
                glUniform4f(line->uniformLocation("uLineColor"), 0.0f, 0.8f, 1.0f, 1.0f);
                glBindVertexArray(vao);
                glDrawArrays(GL_TRIANGLES, 0, 6);
            }
        }
        glBindVertexArray(0);

        SDL_GL_SwapWindow(window);
        SDL_Delay(16);
    }

    std::printf("compiled %zu of %zu shader variants\n",
                gpuContext->shaders().size(), gpuContext->shaders().capacity());

    // Cleanup - programs must go while the GL context is still current.
    gpuContext.reset();
    glDeleteBuffers(1, &vbo);
    glDeleteVertexArrays(1, &vao);
    glDeleteTextures(1, &skin);

    SDL_GL_DeleteContext(glContext);
    SDL_DestroyWindow(window);
    SDL_Quit();

    return 0;
}
