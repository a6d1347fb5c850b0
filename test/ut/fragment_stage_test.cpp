//=============================================================================
// Fragment Stage Tests
//
// Panel selection predicate, texture * tint, glyph coverage masking
//=============================================================================

#include <boost/ut.hpp>
#include <quadshade/fragment-stage.h>
#include "test_helpers.h"

using namespace boost::ut;
using namespace quadshade;
using quadshade::test::near;

namespace {

// Returns the same texel everywhere and remembers the last UV
class FixedSampler : public TextureSampler {
public:
    explicit FixedSampler(const glm::vec4& texel) : _texel(texel) {}

    glm::vec4 sample(glm::vec2 uv) const override {
        _lastUv = uv;
        return _texel;
    }

    glm::vec2 lastUv() const { return _lastUv; }

private:
    glm::vec4 _texel;
    mutable glm::vec2 _lastUv{-1.0f};
};

Varyings panelIn(glm::vec2 uv, glm::vec2 range) {
    Varyings in;
    in.uv = uv;
    in.selectionRangeY = range;
    return in;
}

} // namespace

suite fragment_stage_tests = [] {
    const glm::vec4 menu{0.2f, 0.2f, 0.2f, 1.0f};
    const glm::vec4 selection{0.8f, 0.0f, 0.0f, 1.0f};

    "panel inside the selection range"_test = [=] {
        PanelUniform panel = PanelUniform::make({200, 100}, menu, selection, {0.3f, 0.6f});
        glm::vec4 out = panelFragment(panel, panelIn({0.5f, 0.45f}, {0.3f, 0.6f}));
        expect(near(out, selection));
    };

    "panel outside the selection range"_test = [=] {
        PanelUniform panel = PanelUniform::make({200, 100}, menu, selection, {0.3f, 0.6f});
        expect(near(panelFragment(panel, panelIn({0.5f, 0.1f}, {0.3f, 0.6f})), menu));
        expect(near(panelFragment(panel, panelIn({0.5f, 0.9f}, {0.3f, 0.6f})), menu));
    };

    "selection bounds are exclusive"_test = [=] {
        PanelUniform panel = PanelUniform::make({1, 1}, menu, selection, {0.3f, 0.6f});
        expect(near(panelFragment(panel, panelIn({0.0f, 0.3f}, {0.3f, 0.6f})), menu)) << "at start";
        expect(near(panelFragment(panel, panelIn({0.0f, 0.6f}, {0.3f, 0.6f})), menu)) << "at end";
    };

    "empty selection range never selects"_test = [=] {
        PanelUniform panel = PanelUniform::make({1, 1}, menu, selection, {0.0f, 0.0f});
        for (float y : {0.0f, 0.25f, 0.5f, 1.0f}) {
            expect(near(panelFragment(panel, panelIn({0.5f, y}, {0.0f, 0.0f})), menu));
        }
    };

    "insideSelection ignores x"_test = [] {
        expect(insideSelection(0.5f, {0.0f, 1.0f}));
        expect(!insideSelection(1.0f, {0.0f, 1.0f}));
        expect(!insideSelection(0.5f, {0.6f, 0.4f})) << "inverted range is empty";
    };

    "sprite multiplies texel by tint"_test = [] {
        FixedSampler red({1.0f, 0.0f, 0.0f, 1.0f});
        Varyings in;
        in.uv = {0.25f, 0.75f};
        in.color = {1.0f, 1.0f, 1.0f, 0.5f};

        glm::vec4 out = texturedFragment(red, in);
        expect(near(out, {1.0f, 0.0f, 0.0f, 0.5f}));
        expect(near(red.lastUv(), {0.25f, 0.75f})) << "samples at the interpolated uv";
    };

    "zero alpha in texel or tint gives zero alpha"_test = [] {
        Varyings in;
        in.color = {1.0f, 1.0f, 1.0f, 1.0f};
        FixedSampler clear({0.5f, 0.5f, 0.5f, 0.0f});
        expect(texturedFragment(clear, in).a == 0.0_f);

        in.color = {1.0f, 1.0f, 1.0f, 0.0f};
        FixedSampler opaque({0.5f, 0.5f, 0.5f, 1.0f});
        expect(texturedFragment(opaque, in).a == 0.0_f);
    };

    "glyph alpha is color alpha times coverage"_test = [] {
        FixedSampler halfCoverage({0.5f, 0.0f, 0.0f, 1.0f});
        Varyings in;
        in.packedColor = 0xFF00FF00u;

        glm::vec4 out = glyphFragment(halfCoverage, in, ColorDecode::Conventional);
        expect(near(out, {0.0f, 1.0f, 0.0f, 0.5f}));
    };

    "glyph rgb ignores coverage"_test = [] {
        FixedSampler none({0.0f, 0.7f, 0.7f, 0.7f});
        Varyings in;
        in.packedColor = packColor(255, 128, 0, 128);

        glm::vec4 out = glyphFragment(none, in);
        expect(near(out.r, 1.0f));
        expect(near(out.g, 128.0f / 255.0f));
        expect(out.a == 0.0_f) << "coverage is read from the red channel only";
    };

    "glyph legacy decode keeps the original blue"_test = [] {
        FixedSampler full({1.0f, 0.0f, 0.0f, 1.0f});
        Varyings in;
        in.packedColor = 0xFF010000u;

        glm::vec4 legacy = glyphFragment(full, in, ColorDecode::Legacy);
        glm::vec4 conventional = glyphFragment(full, in, ColorDecode::Conventional);
        expect(near(legacy.b, 65536.0f / 255.0f, 1e-2f));
        expect(conventional.b == 0.0_f);
        expect(near(legacy.r, conventional.r));
    };
};
