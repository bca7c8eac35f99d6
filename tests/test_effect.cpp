#include <gtest/gtest.h>
#include <spritefx/effect.hpp>

#include <cmath>
#include <string>
#include <vector>

using namespace spritefx;

static f64 identity(f64 x) { return x; }

// --- Default registry ---

TEST(EffectRegistry, DefaultOrderAndMasks) {
    auto reg = EffectRegistry::MakeDefault();
    ASSERT_NE(reg, nullptr);
    ASSERT_EQ(reg->count(), 7u);

    const char* expected[] = {"color", "fisheye", "whirl", "pixelate",
                              "mosaic", "brightness", "ghost"};
    for (u32 i = 0; i < reg->count(); ++i) {
        EXPECT_EQ(reg->at(i).name, expected[i]);
        EXPECT_EQ(reg->at(i).bitPosition, i);
        EXPECT_EQ(reg->at(i).mask(), 1u << i);
    }
    EXPECT_EQ(reg->allMask(), 0x7Fu);
}

TEST(EffectRegistry, DefaultShapeChanges) {
    auto reg = EffectRegistry::MakeDefault();
    EXPECT_FALSE(reg->find("color")->shapeChanges);
    EXPECT_TRUE(reg->find("fisheye")->shapeChanges);
    EXPECT_TRUE(reg->find("whirl")->shapeChanges);
    EXPECT_TRUE(reg->find("pixelate")->shapeChanges);
    EXPECT_TRUE(reg->find("mosaic")->shapeChanges);
    EXPECT_FALSE(reg->find("brightness")->shapeChanges);
    EXPECT_FALSE(reg->find("ghost")->shapeChanges);
}

TEST(EffectRegistry, DefaultUniformNames) {
    auto reg = EffectRegistry::MakeDefault();
    EXPECT_EQ(reg->find("color")->uniformName, "uColor");
    EXPECT_EQ(reg->find("ghost")->uniformName, "uGhost");
    for (const Effect& e : reg->effects()) {
        EXPECT_FALSE(e.uniformName.empty()) << e.name;
    }
}

// --- Lookup ---

TEST(EffectRegistry, FindUnknownReturnsNull) {
    auto reg = EffectRegistry::MakeDefault();
    EXPECT_EQ(reg->find("sparkle"), nullptr);
    EXPECT_EQ(reg->find(""), nullptr);
    EXPECT_EQ(reg->maskFor("sparkle"), 0u);
}

TEST(EffectRegistry, MaskFor) {
    auto reg = EffectRegistry::MakeDefault();
    EXPECT_EQ(reg->maskFor(effects::kColor), 1u << 0);
    EXPECT_EQ(reg->maskFor(effects::kWhirl), 1u << 2);
    EXPECT_EQ(reg->maskFor(effects::kGhost), 1u << 6);
}

TEST(EffectRegistry, IsValidMask) {
    auto reg = EffectRegistry::MakeDefault();
    EXPECT_TRUE(reg->isValidMask(0));
    EXPECT_TRUE(reg->isValidMask(0x7F));
    EXPECT_FALSE(reg->isValidMask(0x80));
    EXPECT_FALSE(reg->isValidMask(0x81));
}

TEST(EffectRegistry, ConvertByName) {
    auto reg = EffectRegistry::MakeDefault();
    f64 out = -1.0;
    EXPECT_TRUE(reg->convert("ghost", 50, &out));
    EXPECT_DOUBLE_EQ(out, 0.5);

    out = -1.0;
    EXPECT_FALSE(reg->convert("sparkle", 50, &out));
    EXPECT_DOUBLE_EQ(out, -1.0);
}

// --- Make validation ---

TEST(EffectRegistry, MakeAssignsBitsFromOrder) {
    auto reg = EffectRegistry::Make({{"b", "uB", identity, false, 9},
                                     {"a", "uA", identity, true, 9}});
    ASSERT_NE(reg, nullptr);
    EXPECT_EQ(reg->find("b")->bitPosition, 0u);
    EXPECT_EQ(reg->find("a")->bitPosition, 1u);
    EXPECT_EQ(reg->allMask(), 0x3u);
}

TEST(EffectRegistry, MakeEmptyIsAllowed) {
    auto reg = EffectRegistry::Make({});
    ASSERT_NE(reg, nullptr);
    EXPECT_EQ(reg->count(), 0u);
    EXPECT_EQ(reg->allMask(), 0u);
}

TEST(EffectRegistry, MakeRejectsDuplicateName) {
    auto reg = EffectRegistry::Make({{"a", "uA", identity, false},
                                     {"a", "uA2", identity, false}});
    EXPECT_EQ(reg, nullptr);
}

TEST(EffectRegistry, MakeRejectsEmptyName) {
    EXPECT_EQ(EffectRegistry::Make({{"", "uA", identity, false}}), nullptr);
}

TEST(EffectRegistry, MakeRejectsNonSymbolName) {
    EXPECT_EQ(EffectRegistry::Make({{"hue shift", "uHue", identity, false}}), nullptr);
    EXPECT_EQ(EffectRegistry::Make({{"hue-shift", "uHue", identity, false}}), nullptr);
    EXPECT_EQ(EffectRegistry::Make({{"hue\n", "uHue", identity, false}}), nullptr);
    EXPECT_NE(EffectRegistry::Make({{"hue_Shift2", "uHue", identity, false}}), nullptr);
}

TEST(EffectRegistry, IsSymbolName) {
    EXPECT_TRUE(isSymbolName("whirl"));
    EXPECT_TRUE(isSymbolName("_a9"));
    EXPECT_FALSE(isSymbolName(""));
    EXPECT_FALSE(isSymbolName("a b"));
    EXPECT_FALSE(isSymbolName("a.b"));
}

TEST(EffectRegistry, MakeRejectsNullConverter) {
    EXPECT_EQ(EffectRegistry::Make({{"a", "uA", nullptr, false}}), nullptr);
}

TEST(EffectRegistry, MakeRejectsTooManyEffects) {
    std::vector<Effect> list;
    for (u32 i = 0; i <= EffectRegistry::kMaxEffects; ++i) {
        list.push_back({"e" + std::to_string(i), "u" + std::to_string(i), identity, false});
    }
    EXPECT_EQ(EffectRegistry::Make(list), nullptr);

    list.pop_back();
    EXPECT_NE(EffectRegistry::Make(list), nullptr);
}

// --- Converters ---

TEST(Converters, Color) {
    EXPECT_DOUBLE_EQ(converters::color(0), 0.0);
    EXPECT_DOUBLE_EQ(converters::color(50), 0.25);
    EXPECT_DOUBLE_EQ(converters::color(250), 0.25);
    EXPECT_DOUBLE_EQ(converters::color(-50), -0.25);
}

TEST(Converters, Fisheye) {
    EXPECT_DOUBLE_EQ(converters::fisheye(0), 1.0);
    EXPECT_DOUBLE_EQ(converters::fisheye(100), 2.0);
    EXPECT_DOUBLE_EQ(converters::fisheye(-100), 0.0);
    EXPECT_DOUBLE_EQ(converters::fisheye(-500), 0.0);
}

TEST(Converters, Whirl) {
    EXPECT_DOUBLE_EQ(converters::whirl(0), 0.0);
    EXPECT_NEAR(converters::whirl(180), -3.14159265358979, 1e-12);
    EXPECT_NEAR(converters::whirl(-90), 1.5707963267949, 1e-12);
}

TEST(Converters, Pixelate) {
    EXPECT_DOUBLE_EQ(converters::pixelate(25), 2.5);
    EXPECT_DOUBLE_EQ(converters::pixelate(-25), 2.5);
}

TEST(Converters, MosaicRoundsAndClamps) {
    EXPECT_DOUBLE_EQ(converters::mosaic(0), 1.0);
    EXPECT_DOUBLE_EQ(converters::mosaic(5), 2.0);    // 1.5 rounds up
    EXPECT_DOUBLE_EQ(converters::mosaic(14), 2.0);
    EXPECT_DOUBLE_EQ(converters::mosaic(-40), 5.0);
    EXPECT_DOUBLE_EQ(converters::mosaic(1e6), 512.0);
}

TEST(Converters, BrightnessClamps) {
    EXPECT_DOUBLE_EQ(converters::brightness(50), 0.5);
    EXPECT_DOUBLE_EQ(converters::brightness(150), 1.0);
    EXPECT_DOUBLE_EQ(converters::brightness(-150), -1.0);
}

TEST(Converters, GhostClamps) {
    EXPECT_DOUBLE_EQ(converters::ghost(0), 1.0);
    EXPECT_DOUBLE_EQ(converters::ghost(25), 0.75);
    EXPECT_DOUBLE_EQ(converters::ghost(100), 0.0);
    EXPECT_DOUBLE_EQ(converters::ghost(-20), 1.0);
    EXPECT_DOUBLE_EQ(converters::ghost(200), 0.0);
}

TEST(Converters, PureAndRegistryUnchanged) {
    auto reg = EffectRegistry::MakeDefault();
    const u32 maskBefore = reg->allMask();
    const f64 inputs[] = {-1000, -100, -12.5, 0, 7, 100, 1000};
    for (const Effect& e : reg->effects()) {
        for (f64 x : inputs) {
            const f64 first = e.convert(x);
            const f64 second = e.convert(x);
            EXPECT_TRUE(std::isfinite(first)) << e.name << " " << x;
            EXPECT_DOUBLE_EQ(first, second) << e.name << " " << x;
        }
    }
    EXPECT_EQ(reg->allMask(), maskBefore);
    EXPECT_EQ(reg->count(), 7u);
}
