#include "CropResolver.hpp"
#include "FrameResolver.hpp"
#include "FrameTestUtils.hpp"
#include <gtest/gtest.h>
#include <limits>

namespace {

constexpr int SYSTEM_DECOR_LAYER = 10000;

CropInputs cropFor(const FrameRect& frame, const FrameRect& decor) {
    CropInputs inputs;
    inputs.frame            = frame;
    inputs.decorFrame       = decor;
    inputs.displayFrame     = {0, 0, 1000, 1000};
    inputs.windowLayer      = 1;
    inputs.systemDecorLayer = SYSTEM_DECOR_LAYER;
    return inputs;
}

} // namespace

TEST(CropResolver, EmptyDecorMeansNoCrop) {
    const CropResult R = resolveCrop(cropFor({100, 100, 300, 300}, {}));

    EXPECT_EQ(R.crop, (FrameRect{0, 0, 1000, 1000}));
}

TEST(CropResolver, AboveSystemDecorMeansNoCrop) {
    CropInputs inputs  = cropFor({0, 0, 1000, 1000}, {0, 50, 1000, 900});
    inputs.windowLayer = SYSTEM_DECOR_LAYER + 1;

    EXPECT_EQ(resolveCrop(inputs).crop, (FrameRect{0, 0, 1000, 1000}));
}

TEST(CropResolver, AtSystemDecorLayerIsStillCropped) {
    CropInputs inputs  = cropFor({0, 0, 1000, 1000}, {0, 50, 1000, 900});
    inputs.windowLayer = SYSTEM_DECOR_LAYER;

    EXPECT_EQ(resolveCrop(inputs).crop, (FrameRect{0, 50, 1000, 900}));
}

TEST(CropResolver, DecorClippedToFrame) {
    // window smaller than the decor frame is cropped to its own frame
    EXPECT_EQ(resolveCrop(cropFor({0, 0, 500, 500}, {0, 0, 1000, 1000})).crop, (FrameRect{0, 0, 500, 500}));
}

TEST(CropResolver, CropIsWindowLocal) {
    const CropResult R = resolveCrop(cropFor({200, 100, 700, 600}, {0, 150, 1000, 550}));

    EXPECT_EQ(R.crop, (FrameRect{0, 50, 500, 450}));
}

TEST(CropResolver, TransitionResizingKeepsFullDisplay) {
    CropInputs inputs = cropFor({0, 0, 500, 500}, {0, 0, 1000, 1000});

    EXPECT_EQ(resolveCrop(inputs).crop, (FrameRect{0, 0, 500, 500}));

    inputs.transitionResizing = true;
    EXPECT_EQ(resolveCrop(inputs).crop, (FrameRect{0, 0, 1000, 1000}));
}

TEST(CropResolver, FullDisplayIsDisplaySized) {
    CropInputs inputs   = cropFor({1920, 0, 2420, 500}, {});
    inputs.displayFrame = {1920, 0, 3200, 1024};

    EXPECT_EQ(resolveCrop(inputs).crop, (FrameRect{0, 0, 1280, 1024}));
}

TEST(CropResolver, DisjointDecorCropsEverything) {
    const CropResult R = resolveCrop(cropFor({600, 600, 900, 900}, {0, 0, 300, 300}));

    EXPECT_TRUE(R.crop.empty());
    EXPECT_TRUE(R.crop.wellFormed());
}

TEST(CropResolver, SecondaryDisplayClipsToScreen) {
    CropInputs inputs     = cropFor({-100, 800, 400, 1200}, {0, 0, 1000, 1000});
    inputs.defaultDisplay = false;

    // decor, layers and transitions don't apply without system decor
    inputs.transitionResizing = true;
    EXPECT_EQ(resolveCrop(inputs).crop, (FrameRect{100, 0, 500, 200}));
}

TEST(CropResolver, SecondaryDisplayWindowOnScreen) {
    CropInputs inputs     = cropFor({100, 100, 400, 300}, {});
    inputs.defaultDisplay = false;

    EXPECT_EQ(resolveCrop(inputs).crop, (FrameRect{0, 0, 300, 200}));
}

TEST(CropResolver, InvertedInputIsAContractError) {
    EXPECT_THROW(resolveCrop(cropFor({10, 0, 0, 10}, {})), FrameContractError);
    EXPECT_THROW(resolveCrop(cropFor({0, 0, 10, 10}, {0, 20, 10, 10})), FrameContractError);
}

TEST(CropResolver, FollowsFrameResolver) {
    ReferenceFrames frames;
    frames.parent   = {0, 0, 1000, 1000};
    frames.display  = frames.parent;
    frames.overscan = frames.parent;
    frames.content  = {0, 50, 1000, 900};
    frames.visible  = frames.content;
    frames.stable   = frames.content;
    frames.decor    = frames.content;

    WindowAttributes attrs;
    attrs.horizontal = EAnchor::FILL;
    attrs.vertical   = EAnchor::FILL;

    const FrameResult FRAME = resolveFrame(attrs, {}, frames);

    CropInputs        inputs = cropFor(FRAME.frame, FRAME.decorFrame);
    EXPECT_EQ(resolveCrop(inputs).crop, (FrameRect{0, 50, 1000, 900}));

    inputs.windowLayer = SYSTEM_DECOR_LAYER + 1;
    EXPECT_EQ(resolveCrop(inputs).crop, (FrameRect{0, 0, 1000, 1000}));
}

TEST(CropResolver, FullRangeDisplayCropSaturates) {
    const FrameRect FULL_RANGE   = {std::numeric_limits<int>::min(), std::numeric_limits<int>::min(), std::numeric_limits<int>::max(),
                              std::numeric_limits<int>::max()};
    CropInputs      inputs = cropFor(FULL_RANGE, {});
    inputs.displayFrame    = FULL_RANGE;

    const FrameRect CROP = resolveCrop(inputs).crop;
    EXPECT_EQ(CROP, (FrameRect{0, 0, std::numeric_limits<int>::max(), std::numeric_limits<int>::max()}));

    inputs.defaultDisplay = false;
    EXPECT_TRUE(resolveCrop(inputs).crop.wellFormed());
}

TEST(CropResolver, BarlessDisplayHostsNoSystemDecor) {
    const FrameRect DISPLAY = {0, 0, 1920, 1080};

    EXPECT_FALSE(hostsSystemDecor(DISPLAY, DISPLAY, true));
    EXPECT_TRUE(hostsSystemDecor(DISPLAY, {0, 30, 1920, 1080}, true));
}

TEST(CropResolver, BarlessDisplayCanStayDefault) {
    const FrameRect DISPLAY = {0, 0, 1920, 1080};

    EXPECT_TRUE(hostsSystemDecor(DISPLAY, DISPLAY, false));
    EXPECT_TRUE(hostsSystemDecor(DISPLAY, {0, 30, 1920, 1080}, false));
}
