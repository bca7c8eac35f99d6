#include <gtest/gtest.h>
#include <spritefx/shader_source.hpp>
#include <spritefx/effect.hpp>

#include <string>

using namespace spritefx;

namespace {

size_t countOccurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos;
         pos = text.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

u32 popcount(u32 v) {
    u32 n = 0;
    for (; v; v &= v - 1) ++n;
    return n;
}

class ShaderSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        effects = EffectRegistry::MakeDefault();
        modes = DrawModeRegistry::MakeDefault(*effects);
    }

    ShaderSourceBuilder makeBuilder(ShaderTemplates t) const {
        return ShaderSourceBuilder(effects, modes, std::move(t));
    }

    std::shared_ptr<const EffectRegistry> effects;
    std::shared_ptr<const DrawModeRegistry> modes;
};

} // namespace

// --- Define block ---

TEST_F(ShaderSourceTest, DefaultModeNoEffects) {
    auto builder = makeBuilder(ShaderTemplates::Default());
    EXPECT_EQ(builder.defines(DrawMode::Default, 0), "#define DRAW_MODE_default\n");

    auto symbols = builder.symbols(DrawMode::Default, 0);
    ASSERT_EQ(symbols.size(), 1u);
    EXPECT_EQ(symbols[0], "DRAW_MODE_default");
}

TEST_F(ShaderSourceTest, DefaultModeWhirl) {
    auto builder = makeBuilder(ShaderTemplates::Default());
    EXPECT_EQ(builder.defines(DrawMode::Default, effects->maskFor("whirl")),
              "#define DRAW_MODE_default\n#define ENABLE_whirl\n");
}

TEST_F(ShaderSourceTest, EffectsFollowBitOrder) {
    auto builder = makeBuilder(ShaderTemplates::Default());
    const u32 bits = effects->maskFor("ghost") | effects->maskFor("color") |
                     effects->maskFor("mosaic");
    auto symbols = builder.symbols(DrawMode::ColorMask, bits);
    ASSERT_EQ(symbols.size(), 4u);
    EXPECT_EQ(symbols[0], "DRAW_MODE_colorMask");
    EXPECT_EQ(symbols[1], "ENABLE_color");
    EXPECT_EQ(symbols[2], "ENABLE_mosaic");
    EXPECT_EQ(symbols[3], "ENABLE_ghost");
}

TEST_F(ShaderSourceTest, BuilderDoesNotNormalize) {
    auto builder = makeBuilder(ShaderTemplates::Default());
    auto symbols = builder.symbols(DrawMode::Silhouette, effects->maskFor("color"));
    ASSERT_EQ(symbols.size(), 2u);
    EXPECT_EQ(symbols[1], "ENABLE_color");
}

TEST_F(ShaderSourceTest, OutOfRangeModeHasNoSymbols) {
    auto builder = makeBuilder(ShaderTemplates::Default());
    EXPECT_TRUE(builder.symbols(static_cast<DrawMode>(99), 0x7F).empty());
    EXPECT_EQ(builder.defines(static_cast<DrawMode>(99), 0x7F), "");
}

TEST_F(ShaderSourceTest, SymbolCountsForEveryCombination) {
    auto builder = makeBuilder(ShaderTemplates::Default());
    for (const DrawModeInfo& m : modes->modes()) {
        for (u32 bits = 0; bits <= effects->allMask(); ++bits) {
            const std::string defines = builder.defines(m.mode, bits);
            EXPECT_EQ(countOccurrences(defines, "#define DRAW_MODE_"), 1u);
            EXPECT_EQ(defines.rfind("#define DRAW_MODE_" + m.name + "\n", 0), 0u);
            EXPECT_EQ(countOccurrences(defines, "#define ENABLE_"), popcount(bits));
            for (const Effect& e : effects->effects()) {
                const bool present =
                    defines.find("#define ENABLE_" + e.name + "\n") != std::string::npos;
                EXPECT_EQ(present, (bits & e.mask()) != 0) << m.name << " " << bits;
            }
        }
    }
}

// --- Assembly ---

TEST_F(ShaderSourceTest, AssemblesWithoutVersionLine) {
    auto builder = makeBuilder({"", "VERTEX\n", "FRAGMENT\n"});
    ShaderSource src = builder.build(DrawMode::Line, effects->maskFor("ghost"));
    EXPECT_EQ(src.defines, "#define DRAW_MODE_line\n#define ENABLE_ghost\n");
    EXPECT_EQ(src.vertex, src.defines + "VERTEX\n");
    EXPECT_EQ(src.fragment, src.defines + "FRAGMENT\n");
}

TEST_F(ShaderSourceTest, VersionLineComesFirst) {
    auto builder = makeBuilder({"#version 330 core", "V", "F"});
    ShaderSource src = builder.build(DrawMode::Default, 0);
    EXPECT_EQ(src.vertex, "#version 330 core\n#define DRAW_MODE_default\nV");
    EXPECT_EQ(src.fragment, "#version 330 core\n#define DRAW_MODE_default\nF");
}

TEST_F(ShaderSourceTest, RebuildIsByteIdentical) {
    auto builder = makeBuilder(ShaderTemplates::Default());
    const u32 bits = effects->maskFor("fisheye") | effects->maskFor("pixelate");
    ShaderSource a = builder.build(DrawMode::StraightAlpha, bits);
    ShaderSource b = builder.build(DrawMode::StraightAlpha, bits);
    EXPECT_EQ(a.defines, b.defines);
    EXPECT_EQ(a.vertex, b.vertex);
    EXPECT_EQ(a.fragment, b.fragment);
}

// --- Default templates ---

TEST_F(ShaderSourceTest, DefaultTemplatesGuardEveryEffectAndMode) {
    ShaderTemplates t = ShaderTemplates::Default();
    EXPECT_EQ(t.versionLine, "#version 330 core");
    for (const Effect& e : effects->effects()) {
        EXPECT_NE(t.fragment.find("ENABLE_" + e.name), std::string::npos) << e.name;
        EXPECT_NE(t.fragment.find(e.uniformName), std::string::npos) << e.uniformName;
    }
    for (const char* mode : {"silhouette", "colorMask", "straightAlpha", "line"}) {
        EXPECT_NE(t.fragment.find(std::string("DRAW_MODE_") + mode), std::string::npos) << mode;
    }
    EXPECT_NE(t.vertex.find("DRAW_MODE_line"), std::string::npos);
}

TEST_F(ShaderSourceTest, DefaultTemplatesHaveNoVersionOfTheirOwn) {
    ShaderTemplates t = ShaderTemplates::Default();
    EXPECT_EQ(t.vertex.find("#version"), std::string::npos);
    EXPECT_EQ(t.fragment.find("#version"), std::string::npos);
}
