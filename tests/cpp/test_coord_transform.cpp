#include <gtest/gtest.h>

#include "annokit/geometry/CoordTransform.hpp"

using annokit::geometry::CoordTransform;
using annokit::geometry::Mask;
using annokit::geometry::NormBox;

TEST(CoordTransformTest, ToAbsoluteScalesByImageSize) {
  const NormBox box{0.1, 0.2, 0.5, 0.6};
  const cv::Rect2d abs = CoordTransform::toAbsolute(box, 200, 100);
  EXPECT_NEAR(abs.x, 20.0, 1e-9);
  EXPECT_NEAR(abs.y, 20.0, 1e-9);
  EXPECT_NEAR(abs.width, 80.0, 1e-9);
  EXPECT_NEAR(abs.height, 40.0, 1e-9);
}

TEST(CoordTransformTest, NormalizedRoundTripWithinTolerance) {
  const NormBox boxes[] = {
      {0.0, 0.0, 1.0, 1.0}, {0.123456, 0.654321, 0.5, 0.9}, {0.3, 0.3, 0.3, 0.3}};
  const cv::Size sizes[] = {{640, 480}, {1, 1}, {4032, 3024}};
  for (const auto& size : sizes) {
    for (const auto& box : boxes) {
      const auto back = CoordTransform::toNormalized(
          CoordTransform::toAbsolute(box, size.width, size.height), size.width, size.height);
      EXPECT_NEAR(back.x1, box.x1, 1e-6);
      EXPECT_NEAR(back.y1, box.y1, 1e-6);
      EXPECT_NEAR(back.x2, box.x2, 1e-6);
      EXPECT_NEAR(back.y2, box.y2, 1e-6);
    }
  }
}

TEST(CoordTransformTest, ZeroSizeBoxIsAllowed) {
  const cv::Rect2d abs = CoordTransform::toAbsolute({0.5, 0.5, 0.5, 0.5}, 100, 100);
  EXPECT_DOUBLE_EQ(abs.x, 50.0);
  EXPECT_DOUBLE_EQ(abs.width, 0.0);
  EXPECT_DOUBLE_EQ(abs.height, 0.0);
}

TEST(CoordTransformTest, InvalidImageSizeYieldsEmpty) {
  const cv::Rect2d abs = CoordTransform::toAbsolute({0.1, 0.1, 0.2, 0.2}, 0, 100);
  EXPECT_DOUBLE_EQ(abs.width, 0.0);
  EXPECT_DOUBLE_EQ(abs.height, 0.0);

  const NormBox box = CoordTransform::toNormalized(cv::Rect2d(1, 2, 3, 4), 100, -5);
  EXPECT_DOUBLE_EQ(box.x1, 0.0);
  EXPECT_DOUBLE_EQ(box.x2, 0.0);
}

TEST(CoordTransformTest, LocalizeThenRelocalizeIsIdentity) {
  const Mask mask = {{10.5, 20.0}, {30.0, 40.25}, {15.0, 60.0}};
  const auto local = CoordTransform::localizeMask(mask, 10.0, 20.0);
  ASSERT_EQ(local.size(), 6u);
  EXPECT_DOUBLE_EQ(local[0], 0.5);
  EXPECT_DOUBLE_EQ(local[1], 0.0);
  EXPECT_DOUBLE_EQ(local[3], 20.25);

  const Mask back = CoordTransform::relocalizeMask(local, 10.0, 20.0);
  ASSERT_EQ(back.size(), mask.size());
  for (size_t i = 0; i < mask.size(); ++i) {
    EXPECT_DOUBLE_EQ(back[i].x, mask[i].x);
    EXPECT_DOUBLE_EQ(back[i].y, mask[i].y);
  }
}

TEST(CoordTransformTest, RelocalizeDropsTrailingCoordinate) {
  const Mask back = CoordTransform::relocalizeMask({1.0, 2.0, 3.0}, 0.0, 0.0);
  ASSERT_EQ(back.size(), 1u);
  EXPECT_DOUBLE_EQ(back[0].y, 2.0);
}

TEST(CoordTransformTest, ViewToImageUndoesPanAndZoom) {
  const cv::Point2d pan(40.0, -10.0);
  const cv::Point2d p = CoordTransform::viewToImage({240.0, 90.0}, pan, 2.0);
  EXPECT_DOUBLE_EQ(p.x, 100.0);
  EXPECT_DOUBLE_EQ(p.y, 50.0);

  const cv::Point2d v = CoordTransform::imageToView(p, pan, 2.0);
  EXPECT_DOUBLE_EQ(v.x, 240.0);
  EXPECT_DOUBLE_EQ(v.y, 90.0);
}

TEST(CoordTransformTest, ViewToImageIgnoresNonPositiveScale) {
  const cv::Point2d p = CoordTransform::viewToImage({50.0, 60.0}, {10.0, 10.0}, 0.0);
  EXPECT_DOUBLE_EQ(p.x, 40.0);
  EXPECT_DOUBLE_EQ(p.y, 50.0);
}

TEST(CoordTransformTest, FitScaleNeverUpscales) {
  EXPECT_DOUBLE_EQ(CoordTransform::fitScale({2000, 1000}, {1000, 1000}), 0.5);
  EXPECT_DOUBLE_EQ(CoordTransform::fitScale({1000, 2000}, {1000, 500}), 0.25);
  EXPECT_DOUBLE_EQ(CoordTransform::fitScale({100, 100}, {1000, 1000}), 1.0);
  EXPECT_DOUBLE_EQ(CoordTransform::fitScale({100, 100}, {0, 0}), 1.0);
}

TEST(CoordTransformTest, RectFromCornersOrdersPoints) {
  const cv::Rect2d r = CoordTransform::rectFromCorners({80.0, 60.0}, {10.0, 10.0});
  EXPECT_DOUBLE_EQ(r.x, 10.0);
  EXPECT_DOUBLE_EQ(r.y, 10.0);
  EXPECT_DOUBLE_EQ(r.width, 70.0);
  EXPECT_DOUBLE_EQ(r.height, 50.0);
}
