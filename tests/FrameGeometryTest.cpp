#include "FrameGeometry.hpp"
#include "FrameTestUtils.hpp"
#include <gtest/gtest.h>

TEST(FrameGeometry, EmptyAndWellFormed) {
    EXPECT_TRUE((FrameRect{}).empty());
    EXPECT_TRUE((FrameRect{10, 10, 10, 50}).empty());
    EXPECT_TRUE((FrameRect{10, 10, 50, 10}).empty());
    EXPECT_FALSE((FrameRect{-20, -20, 10, 10}).empty());

    EXPECT_TRUE((FrameRect{5, 5, 5, 5}).wellFormed());
    EXPECT_FALSE((FrameRect{6, 0, 5, 10}).wellFormed());
    EXPECT_FALSE((FrameRect{0, 6, 10, 5}).wellFormed());
}

TEST(FrameGeometry, IntersectOverlapping) {
    EXPECT_EQ(intersectRects({0, 0, 1000, 1000}, {0, 50, 1000, 900}), (FrameRect{0, 50, 1000, 900}));
    EXPECT_EQ(intersectRects({300, 300, 700, 700}, {0, 0, 500, 500}), (FrameRect{300, 300, 500, 500}));
    EXPECT_EQ(intersectRects({-100, -100, 50, 50}, {0, 0, 100, 100}), (FrameRect{0, 0, 50, 50}));
}

TEST(FrameGeometry, IntersectDisjointCollapsesWithoutInverting) {
    const FrameRect R = intersectRects({0, 0, 100, 100}, {200, 300, 400, 500});

    EXPECT_TRUE(R.empty());
    EXPECT_TRUE(R.wellFormed());
    EXPECT_EQ(R, (FrameRect{200, 300, 200, 300}));
}

TEST(FrameGeometry, InsetsOnlyWhereFrameExtendsBeyond) {
    EXPECT_EQ(insetsBeyond({0, 0, 1000, 1000}, {0, 50, 1000, 900}), (FrameInsets{0, 50, 0, 100}));
    EXPECT_EQ(insetsBeyond({0, 0, 1000, 1000}, {20, 0, 910, 1000}), (FrameInsets{20, 0, 90, 0}));

    // contained frame gets nothing, never negative
    EXPECT_TRUE(insetsBeyond({100, 100, 200, 200}, {0, 50, 1000, 900}).isZero());
}

TEST(FrameGeometry, ClampShiftsBeforeClipping) {
    const FrameRect CONTAINER = {0, 0, 1000, 1000};

    EXPECT_EQ(clampInto({300, 300, 1300, 1300}, CONTAINER), (FrameRect{0, 0, 1000, 1000}));
    EXPECT_EQ(clampInto({900, -50, 1100, 150}, CONTAINER), (FrameRect{800, 0, 1000, 200}));
    EXPECT_EQ(clampInto({0, 0, 1200, 1200}, CONTAINER), CONTAINER);
    EXPECT_EQ(clampInto({-500, 100, 1500, 200}, CONTAINER), (FrameRect{0, 100, 1000, 200}));
}

TEST(FrameGeometry, ClampKeepsFittingSizes) {
    const FrameRect CONTAINER = {0, 0, 1000, 1000};
    const FrameRect FITS      = {100, 100, 400, 300};

    EXPECT_EQ(clampInto(FITS, CONTAINER), FITS);

    const FrameRect SHIFTED = clampInto({850, 850, 1150, 1050}, CONTAINER);
    EXPECT_EQ(SHIFTED.width(), 300);
    EXPECT_EQ(SHIFTED.height(), 200);
}

TEST(FrameGeometry, ClampIsIdempotent) {
    const FrameRect CONTAINER = {-200, 50, 600, 450};

    for (const FrameRect& rect : {FrameRect{-400, 0, 0, 100}, FrameRect{500, 400, 900, 900}, FrameRect{0, 0, 2000, 10}, FrameRect{10, 60, 10, 60}}) {
        const FrameRect ONCE = clampInto(rect, CONTAINER);
        EXPECT_EQ(clampInto(ONCE, CONTAINER), ONCE) << toString(rect);
        EXPECT_TRUE(CONTAINER.contains(ONCE)) << toString(rect);
    }
}

TEST(FrameGeometry, ClampIntoEmptyContainer) {
    const FrameRect R = clampInto({0, 0, 100, 100}, {50, 50, 50, 50});

    EXPECT_TRUE(R.empty());
    EXPECT_TRUE(R.wellFormed());
}

TEST(FrameGeometry, ToLocal) {
    EXPECT_EQ(toLocal({150, 250, 300, 400}, {100, 200, 500, 600}), (FrameRect{50, 50, 200, 200}));
    EXPECT_EQ(toLocal({0, 0, 10, 10}, {-20, -30, 0, 0}), (FrameRect{20, 30, 30, 40}));
}

TEST(FrameGeometry, RequireWellFormed) {
    EXPECT_NO_THROW(requireWellFormed({}, "empty"));
    EXPECT_NO_THROW(requireWellFormed({-10, -10, -5, -5}, "offscreen"));

    try {
        requireWellFormed({10, 0, 5, 10}, "content");
        FAIL() << "inverted rect accepted";
    } catch (const FrameContractError& e) {
        EXPECT_STREQ(e.what(), "content frame is inverted: (10, 0, 5, 10)");
    }
}

TEST(FrameGeometry, ToString) {
    EXPECT_EQ(toString(FrameRect{-1, 2, 30, 400}), "(-1, 2, 30, 400)");
    EXPECT_EQ(toString(FrameInsets{0, 50, 0, 100}), "(0, 50, 0, 100)");
}
