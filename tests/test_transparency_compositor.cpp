#include <gtest/gtest.h>

#include <stdexcept>

#include "Raster.h"
#include "TransparencyCompositor.h"

using namespace PureVision;

namespace {

const RGBColor kWhite{255, 255, 255};
// 30^2 + 40^2 = 50^2 away from white.
const RGBColor kFifty{225, 215, 255};

cv::Vec4b px(const RGBColor& c, int alpha = 255) {
    return cv::Vec4b(c.b, c.g, c.r, static_cast<uchar>(alpha));
}

} // namespace

TEST(KeyAlpha, TransparentUpToToleranceInclusive) {
    EXPECT_EQ(keyAlpha(0.0, 20, 30), 0);
    EXPECT_EQ(keyAlpha(19.99, 20, 30), 0);
    EXPECT_EQ(keyAlpha(20.0, 20, 30), 0);
}

TEST(KeyAlpha, OpaqueFromRampEndInclusive) {
    EXPECT_EQ(keyAlpha(50.0, 20, 30), 255);
    EXPECT_EQ(keyAlpha(50.01, 20, 30), 255);
    EXPECT_EQ(keyAlpha(441.0, 20, 30), 255);
}

TEST(KeyAlpha, LinearRampRoundsToNearest) {
    EXPECT_EQ(keyAlpha(35.0, 20, 30), 128);  // 127.5
    EXPECT_EQ(keyAlpha(26.0, 20, 30), 51);   // 51.0
    EXPECT_EQ(keyAlpha(44.0, 20, 30), 204);  // 204.0
}

TEST(KeyAlpha, MonotonicAcrossBand) {
    int previous = 0;
    for (double d = 20.0; d <= 50.0; d += 0.25) {
        const int a = keyAlpha(d, 20, 30);
        EXPECT_GE(a, previous) << "d=" << d;
        previous = a;
    }
    EXPECT_EQ(previous, 255);
}

TEST(KeyAlpha, ZeroSmoothnessActsAsOne) {
    EXPECT_EQ(keyAlpha(10.0, 10, 0), 0);
    EXPECT_EQ(keyAlpha(10.5, 10, 0), 128);
    EXPECT_EQ(keyAlpha(11.0, 10, 0), 255);
    EXPECT_EQ(keyAlpha(11.0, 10, 0), keyAlpha(11.0, 10, 1));
}

TEST(TransparencyCompositor, EndToEndFourByFour) {
    cv::Mat img(4, 4, CV_8UC4);
    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 4; ++x) {
            img.at<cv::Vec4b>(y, x) = (y < 2) ? px(kWhite) : px(kFifty);
        }
    }

    const cv::Mat out = TransparencyCompositor::apply(img, KeyParameters{kWhite, 20, 30});
    ASSERT_EQ(out.size(), img.size());
    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 4; ++x) {
            const cv::Vec4b& p = out.at<cv::Vec4b>(y, x);
            EXPECT_EQ(p[3], (y < 2) ? 0 : 255) << "at " << x << "," << y;
        }
    }
}

TEST(TransparencyCompositor, KeepsRgbUnderTransparentPixels) {
    const RGBColor nearWhite{250, 252, 251};
    cv::Mat img(2, 3, CV_8UC4, cv::Scalar(nearWhite.b, nearWhite.g, nearWhite.r, 255));
    const cv::Mat out = TransparencyCompositor::apply(img, KeyParameters{kWhite, 20, 30});
    for (int y = 0; y < out.rows; ++y) {
        for (int x = 0; x < out.cols; ++x) {
            const cv::Vec4b& p = out.at<cv::Vec4b>(y, x);
            EXPECT_EQ(p[3], 0);
            EXPECT_EQ(p[0], nearWhite.b);
            EXPECT_EQ(p[1], nearWhite.g);
            EXPECT_EQ(p[2], nearWhite.r);
        }
    }
}

TEST(TransparencyCompositor, ForcesOpaqueOutsideBand) {
    // Pre-existing transparency far from the target is discarded.
    cv::Mat img(1, 1, CV_8UC4);
    img.at<cv::Vec4b>(0, 0) = px({0, 0, 0}, 17);
    TransparencyCompositor::applyInPlace(img, KeyParameters{kWhite, 20, 30});
    EXPECT_EQ(img.at<cv::Vec4b>(0, 0)[3], 255);
}

TEST(TransparencyCompositor, ApplyLeavesSourceUntouched) {
    cv::Mat img(3, 3, CV_8UC4, cv::Scalar(255, 255, 255, 255));
    const cv::Mat out = TransparencyCompositor::apply(img, KeyParameters{kWhite, 0, 1});
    EXPECT_EQ(out.at<cv::Vec4b>(1, 1)[3], 0);
    EXPECT_EQ(img.at<cv::Vec4b>(1, 1)[3], 255);
}

TEST(TransparencyCompositor, IdempotentWithoutRampPixels) {
    cv::Mat img(8, 8, CV_8UC4);
    for (int y = 0; y < 8; ++y) {
        for (int x = 0; x < 8; ++x) {
            img.at<cv::Vec4b>(y, x) = ((x + y) % 2 == 0) ? px(kWhite) : px({10, 10, 10});
        }
    }
    const KeyParameters params{kWhite, 20, 30};
    const cv::Mat once = TransparencyCompositor::apply(img, params);
    const cv::Mat twice = TransparencyCompositor::apply(once, params);
    EXPECT_EQ(cv::norm(once, twice, cv::NORM_INF), 0.0);
}

TEST(TransparencyCompositor, LargeImageMatchesPerPixelRule) {
    // Exercises the row-parallel path.
    cv::Mat img(257, 131, CV_8UC4);
    for (int y = 0; y < img.rows; ++y) {
        for (int x = 0; x < img.cols; ++x) {
            img.at<cv::Vec4b>(y, x) = cv::Vec4b(static_cast<uchar>(x), static_cast<uchar>(y), 255, 255);
        }
    }
    const KeyParameters params{{255, 0, 0}, 40, 60};
    const cv::Mat out = TransparencyCompositor::apply(img, params);
    for (int y = 0; y < img.rows; y += 7) {
        for (int x = 0; x < img.cols; x += 5) {
            const double d = colorDistance(pixelColor(img.at<cv::Vec4b>(y, x)), params.targetColor);
            EXPECT_EQ(out.at<cv::Vec4b>(y, x)[3], keyAlpha(d, 40, 60));
        }
    }
}

TEST(TransparencyCompositor, EmptyRasterIsNoOp) {
    cv::Mat empty;
    EXPECT_NO_THROW(TransparencyCompositor::applyInPlace(empty, KeyParameters{kWhite, 20, 30}));
    EXPECT_TRUE(empty.empty());
}

TEST(TransparencyCompositor, RejectsInvalidInput) {
    cv::Mat img(2, 2, CV_8UC4, cv::Scalar::all(0));
    EXPECT_THROW(TransparencyCompositor::applyInPlace(img, KeyParameters{kWhite, -1, 30}), std::invalid_argument);
    EXPECT_THROW(TransparencyCompositor::applyInPlace(img, KeyParameters{kWhite, 20, -1}), std::invalid_argument);

    cv::Mat bgr(2, 2, CV_8UC3, cv::Scalar::all(0));
    EXPECT_THROW(TransparencyCompositor::applyInPlace(bgr, KeyParameters{kWhite, 20, 30}), std::invalid_argument);
}
