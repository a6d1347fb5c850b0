//=============================================================================
// Packed Color Tests
//
// 0xAARRGGBB encoding and the two decode policies
//=============================================================================

#include <boost/ut.hpp>
#include <quadshade/packed-color.h>
#include "test_helpers.h"

#include <string>

using namespace boost::ut;
using namespace quadshade;
using quadshade::test::near;

suite packed_color_tests = [] {
    "packColor puts alpha in the high byte"_test = [] {
        static_assert(packColor(0x12, 0x34, 0x56, 0x78) == 0x78123456u);
        expect(packColor(255, 0, 0, 255) == 0xFFFF0000u);
        expect(packColor(0, 0, 255, 0) == 0x000000FFu);
    };

    "packColor from floats rounds and clamps"_test = [] {
        expect(packColor(glm::vec4(1.0f, 0.0f, 0.0f, 1.0f)) == 0xFFFF0000u);
        expect(packColor(glm::vec4(0.5f, 0.5f, 0.5f, 1.0f)) == 0xFF808080u);
        expect(packColor(glm::vec4(2.0f, -1.0f, 0.0f, 1.0f)) == 0xFFFF0000u);
    };

    "conventional decode recovers every channel"_test = [] {
        uint32_t c = packColor(0x40, 0x80, 0xC0, 0xFF);
        glm::vec4 rgba = unpackColor(c, ColorDecode::Conventional);

        expect(near(rgba.r, 64.0f / 255.0f));
        expect(near(rgba.g, 128.0f / 255.0f));
        expect(near(rgba.b, 192.0f / 255.0f));
        expect(near(rgba.a, 1.0f));
    };

    "legacy decode reads blue from the unshifted red mask"_test = [] {
        uint32_t c = packColor(0x40, 0x80, 0xC0, 0xFF);
        glm::vec4 rgba = unpackColor(c, ColorDecode::Legacy);

        expect(near(rgba.r, 64.0f / 255.0f));
        expect(near(rgba.g, 128.0f / 255.0f));
        expect(near(rgba.b, float(0x00400000u) / 255.0f, 1.0f));
        expect(near(rgba.a, 1.0f));
    };

    "legacy blue is zero exactly when red is zero"_test = [] {
        glm::vec4 green = unpackColor(0xFF00FF00u, ColorDecode::Legacy);
        expect(green.b == 0.0_f);

        glm::vec4 blue = unpackColor(0xFF0000FFu, ColorDecode::Legacy);
        expect(blue.b == 0.0_f) << "blue byte is ignored by the legacy decode";
    };

    "red, green and alpha agree across policies"_test = [] {
        for (uint32_t c : {0x00000000u, 0xFFFFFFFFu, 0x80FF0010u, 0x12345678u}) {
            glm::vec4 a = unpackColor(c, ColorDecode::Conventional);
            glm::vec4 b = unpackColor(c, ColorDecode::Legacy);
            expect(a.r == b.r && a.g == b.g && a.a == b.a) << c;
        }
    };

    "policy names parse and print"_test = [] {
        expect(parseColorDecode("legacy") == ColorDecode::Legacy);
        expect(parseColorDecode("conventional") == ColorDecode::Conventional);
        expect(!parseColorDecode("Legacy").has_value());
        expect(std::string(toString(ColorDecode::Legacy)) == "legacy");
    };
};
