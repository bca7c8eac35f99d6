// Default sprite shader templates.
//
// Both stages are compiled once per (draw mode, effect bits) variant with a
// block of DRAW_MODE_* / ENABLE_* defines inserted after the #version line.

#include "spritefx/shader_source.hpp"

namespace spritefx {

static const char* kVersionLine = "#version 330 core";

static const char* kSpriteVertSrc = R"(
#ifdef DRAW_MODE_line
uniform vec2 uStageSize;
uniform float uLineThickness;
uniform vec4 uPenPoints;

// Keeps divisors away from zero.
const float epsilon = 1e-3;
#else
uniform mat4 uProjectionMatrix;
uniform mat4 uModelMatrix;
layout(location = 1) in vec2 aTexCoord;
#endif

layout(location = 0) in vec2 aPosition;

out vec2 vTexCoord;

void main() {
#ifdef DRAW_MODE_line
    // aPosition spans the unit quad. Stretch it into a box around the two
    // pen points, padded so antialiased edges stay inside at any angle.
    vec2 position = aPosition;
    float expandedRadius = (uLineThickness * 0.5) + 1.4142135623730951;

    float lineLength = length(uPenPoints.zw - uPenPoints.xy);

    position.x *= lineLength + (2.0 * expandedRadius);
    position.y *= 2.0 * expandedRadius;
    position -= expandedRadius;

    vec2 dir = (uPenPoints.zw - uPenPoints.xy + epsilon) / (lineLength + epsilon);
    position = mat2(dir.x, dir.y, -dir.y, dir.x) * position;
    position += uPenPoints.xy;

    position *= 2.0 / uStageSize;

    gl_Position = vec4(position, 0.0, 1.0);
    vTexCoord = position * 0.5 * uStageSize;
#else
    gl_Position = uProjectionMatrix * uModelMatrix * vec4(aPosition, 0.0, 1.0);
    vTexCoord = aTexCoord;
#endif
}
)";

static const char* kSpriteFragSrc = R"(
#ifdef DRAW_MODE_silhouette
uniform vec4 uSilhouetteColor;
#else
# ifdef ENABLE_color
uniform float uColor;
# endif
# ifdef ENABLE_brightness
uniform float uBrightness;
# endif
#endif

#ifdef DRAW_MODE_colorMask
uniform vec3 uColorMask;
uniform float uColorMaskTolerance;
#endif

#ifdef ENABLE_fisheye
uniform float uFisheye;
#endif
#ifdef ENABLE_whirl
uniform float uWhirl;
#endif
#ifdef ENABLE_pixelate
uniform float uPixelate;
uniform vec2 uSkinSize;
#endif
#ifdef ENABLE_mosaic
uniform float uMosaic;
#endif
#ifdef ENABLE_ghost
uniform float uGhost;
#endif

#ifdef DRAW_MODE_line
uniform vec4 uLineColor;
uniform float uLineThickness;
uniform vec4 uPenPoints;
#endif

uniform sampler2D uSkin;

in vec2 vTexCoord;
out vec4 FragColor;

// Keeps divisors away from zero for fully transparent pixels.
const float epsilon = 1e-3;

#if !defined(DRAW_MODE_silhouette) && defined(ENABLE_color)
// Branchless RGB <-> HSV, all components in [0, 1].
vec3 rgbToHsv(vec3 rgb) {
    const vec4 hueOffsets = vec4(0.0, -1.0 / 3.0, 2.0 / 3.0, -1.0);
    vec4 t1 = rgb.b > rgb.g ? vec4(rgb.bg, hueOffsets.wz) : vec4(rgb.gb, hueOffsets.xy);
    vec4 t2 = rgb.r > t1.x ? vec4(rgb.r, t1.yzx) : vec4(t1.xyw, rgb.r);
    float m = min(t2.y, t2.w);
    float c = t2.x - m;
    return vec3(abs(t2.z + (t2.w - t2.y) / (6.0 * c + epsilon)),
                c / (t2.x + epsilon),
                t2.x);
}

vec3 hueToRgb(float hue) {
    float r = abs(hue * 6.0 - 3.0) - 1.0;
    float g = 2.0 - abs(hue * 6.0 - 2.0);
    float b = 2.0 - abs(hue * 6.0 - 4.0);
    return clamp(vec3(r, g, b), 0.0, 1.0);
}

vec3 hsvToRgb(vec3 hsv) {
    vec3 rgb = hueToRgb(hsv.x);
    float c = hsv.z * hsv.y;
    return rgb * c + hsv.z - c;
}
#endif

const vec2 kCenter = vec2(0.5, 0.5);

void main() {
#ifndef DRAW_MODE_line
    vec2 uv = vTexCoord;

#ifdef ENABLE_mosaic
    uv = fract(uMosaic * uv);
#endif

#ifdef ENABLE_pixelate
    {
        vec2 blocks = uSkinSize / uPixelate;
        uv = (floor(uv * blocks) + kCenter) / blocks;
    }
#endif

#ifdef ENABLE_whirl
    {
        const float kRadius = 0.5;
        vec2 offset = uv - kCenter;
        float falloff = max(1.0 - (length(offset) / kRadius), 0.0);
        float angle = uWhirl * falloff * falloff;
        float s = sin(angle);
        float c = cos(angle);
        uv = mat2(c, -s, s, c) * offset + kCenter;
    }
#endif

#ifdef ENABLE_fisheye
    {
        vec2 v = (uv - kCenter) / kCenter;
        float len = length(v);
        float r = pow(min(len, 1.0), uFisheye) * max(1.0, len);
        uv = kCenter + r * (v / len) * kCenter;
    }
#endif

    FragColor = texture(uSkin, uv);

#if !defined(DRAW_MODE_silhouette) && (defined(ENABLE_color) || defined(ENABLE_brightness))
    // Color math runs on straight alpha.
    FragColor.rgb = clamp(FragColor.rgb / (FragColor.a + epsilon), 0.0, 1.0);

#ifdef ENABLE_color
    {
        vec3 hsv = rgbToHsv(FragColor.rgb);

        // Give near-grey pixels a little saturation so a hue shift shows.
        const float minLightness = 0.11 / 2.0;
        const float minSaturation = 0.09;
        if (hsv.z < minLightness) hsv = vec3(0.0, 1.0, minLightness);
        else if (hsv.y < minSaturation) hsv = vec3(0.0, minSaturation, hsv.z);

        hsv.x = mod(hsv.x + uColor, 1.0);
        if (hsv.x < 0.0) hsv.x += 1.0;

        FragColor.rgb = hsvToRgb(hsv);
    }
#endif

#ifdef ENABLE_brightness
    FragColor.rgb = clamp(FragColor.rgb + vec3(uBrightness), vec3(0.0), vec3(1.0));
#endif

    FragColor.rgb *= FragColor.a + epsilon;
#endif

#ifdef ENABLE_ghost
    FragColor *= uGhost;
#endif

#ifdef DRAW_MODE_silhouette
    if (FragColor.a == 0.0) {
        discard;
    }
    // The solid color replaces the sample only after the alpha test.
    FragColor = uSilhouetteColor;
#endif

#ifdef DRAW_MODE_colorMask
    vec3 maskDistance = abs(FragColor.rgb - uColorMask);
    if (any(greaterThan(maskDistance, vec3(uColorMaskTolerance)))) {
        discard;
    }
#endif

#ifdef DRAW_MODE_straightAlpha
    FragColor.rgb /= FragColor.a + epsilon;
#endif

#else
    // Round-capped line from the distance to the segment uPenPoints.xy -> zw.
    vec2 pa = vTexCoord - uPenPoints.xy;
    vec2 ba = uPenPoints.zw - uPenPoints.xy;
    float along = clamp(dot(pa, ba) / dot(ba, ba), 0.0, 1.0);
    float lineDistance = length(pa - (ba * along));

    // One-pixel ramp at the edge gives the antialiasing.
    float coverage = clamp((uLineThickness + 1.0) * 0.5 - lineDistance, 0.0, 1.0);

    FragColor = uLineColor * coverage;
#endif
}
)";

ShaderTemplates ShaderTemplates::Default() {
    ShaderTemplates t;
    t.versionLine = kVersionLine;
    t.vertex = kSpriteVertSrc;
    t.fragment = kSpriteFragSrc;
    return t;
}

} // namespace spritefx
