#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <limits>

#include "annokit/infer/DetectionFileProvider.hpp"
#include "annokit/post/Postprocess.hpp"

using annokit::infer::Detection;
using annokit::infer::DetectionFileProvider;
using annokit::infer::DetectionPrompt;
using annokit::infer::DetectionResult;
using annokit::post::Postprocess;

namespace fs = std::filesystem;

TEST(DetectionFileProviderTest, ParsesObjectForm) {
  const auto root = YAML::Load(R"(
classes: [person, car]
objects:
  - {class_id: 1, confidence: 0.9, bbox: [0.1, 0.2, 0.4, 0.8], mask: [[10, 20], [30, 40], [15, 45]]}
  - {class_name: dog, confidence: 0.5, bbox: [0.5, 0.5, 0.6, 0.6]}
  - {class_id: 0, bbox: [0.1, 0.2]}
)");
  const auto result = DetectionFileProvider::parse(root, {640, 480});
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->classes, (std::vector<std::string>{"person", "car"}));
  ASSERT_EQ(result->detections.size(), 2u);

  const Detection& first = result->detections[0];
  EXPECT_EQ(first.class_id, 1);
  EXPECT_FLOAT_EQ(first.confidence, 0.9f);
  EXPECT_DOUBLE_EQ(first.bbox.x2, 0.4);
  ASSERT_TRUE(first.mask.has_value());
  EXPECT_EQ(first.mask->size(), 3u);
  EXPECT_DOUBLE_EQ((*first.mask)[1].y, 40.0);

  EXPECT_EQ(result->detections[1].class_name, "dog");
  EXPECT_FALSE(result->detections[1].mask.has_value());
}

TEST(DetectionFileProviderTest, ParsesSummaryFormAndNormalizes) {
  const auto root = YAML::Load(R"(
{"class": ["person", "car"], "conf": [0.9, 0.4],
 "bbox": [[64, 96, 320, 480], [0, 0, 640, 240]],
 "masks": [[[70, 100], [250, 100], [250, 380]], null]}
)");
  const auto result = DetectionFileProvider::parse(root, {640, 480});
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->detections.size(), 2u);

  const Detection& first = result->detections[0];
  EXPECT_EQ(first.class_name, "person");
  EXPECT_NEAR(first.bbox.x1, 0.1, 1e-9);
  EXPECT_NEAR(first.bbox.y1, 0.2, 1e-9);
  EXPECT_NEAR(first.bbox.x2, 0.5, 1e-9);
  EXPECT_NEAR(first.bbox.y2, 1.0, 1e-9);
  ASSERT_TRUE(first.mask.has_value());
  EXPECT_DOUBLE_EQ((*first.mask)[1].x, 250.0);

  EXPECT_FLOAT_EQ(result->detections[1].confidence, 0.4f);
  EXPECT_FALSE(result->detections[1].mask.has_value());
}

TEST(DetectionFileProviderTest, SummaryFormNeedsImageSize) {
  const auto root = YAML::Load("{class: [a], conf: [1.0], bbox: [[0, 0, 10, 10]]}");
  EXPECT_FALSE(DetectionFileProvider::parse(root, {0, 0}).has_value());
}

TEST(DetectionFileProviderTest, EmptyMapIsEmptyResult) {
  const auto result = DetectionFileProvider::parse(YAML::Load("{note: nothing found}"), {10, 10});
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->detections.empty());
}

TEST(DetectionFileProviderTest, NonMapIsFailure) {
  EXPECT_FALSE(DetectionFileProvider::parse(YAML::Load("[1, 2, 3]"), {10, 10}).has_value());
}

TEST(DetectionFileProviderTest, DetectLooksUpFileByStem) {
  const fs::path dir = fs::path(::testing::TempDir()) / "annokit_detections";
  fs::remove_all(dir);
  fs::create_directories(dir);
  {
    std::ofstream out(dir / "street.json");
    out << R"({"classes": ["car"], "objects": [{"class_id": 0, "confidence": 0.7, "bbox": [0.1, 0.1, 0.2, 0.2]}]})";
  }
  {
    std::ofstream out(dir / "broken.yaml");
    out << "objects: [unterminated\n";
  }

  DetectionFileProvider provider(dir.string());
  EXPECT_EQ(provider.name(), "file");
  EXPECT_EQ(provider.findFileFor("/images/street.jpg"), (dir / "street.json").string());
  EXPECT_TRUE(provider.findFileFor("/images/missing.jpg").empty());

  const auto result = provider.detect("/images/street.jpg", {100, 100}, DetectionPrompt{});
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->detections.size(), 1u);
  EXPECT_FLOAT_EQ(result->detections[0].confidence, 0.7f);

  EXPECT_FALSE(provider.detect("/images/missing.jpg", {100, 100}, DetectionPrompt{}).has_value());
  EXPECT_FALSE(provider.detect("/images/broken.png", {100, 100}, DetectionPrompt{}).has_value());
  fs::remove_all(dir);
}

TEST(PostprocessTest, ToObjectsResolvesAndOrders) {
  DetectionResult result;
  result.classes = {"person"};

  Detection by_id;
  by_id.class_id = 0;
  by_id.confidence = 1.5f;
  by_id.bbox = {0.6, 0.8, 0.2, 0.1};
  result.detections.push_back(by_id);

  Detection by_name;
  by_name.class_name = "bicycle";
  by_name.confidence = 0.3f;
  by_name.bbox = {0.1, 0.1, 0.2, 0.2};
  result.detections.push_back(by_name);

  Detection unknown;
  unknown.class_id = 7;
  unknown.bbox = {0.1, 0.1, 0.2, 0.2};
  result.detections.push_back(unknown);

  Detection broken;
  broken.class_id = 0;
  broken.bbox = {std::numeric_limits<double>::infinity(), 0.1, 0.2, 0.2};
  result.detections.push_back(broken);

  std::vector<std::string> classes = result.classes;
  const auto objects = Postprocess::toObjects(result, classes);
  ASSERT_EQ(objects.size(), 2u);
  EXPECT_EQ(classes, (std::vector<std::string>{"person", "bicycle"}));

  EXPECT_EQ(objects[0].class_id, 0);
  EXPECT_FLOAT_EQ(objects[0].confidence, 1.0f);
  EXPECT_DOUBLE_EQ(objects[0].bbox.x1, 0.2);
  EXPECT_DOUBLE_EQ(objects[0].bbox.x2, 0.6);
  EXPECT_DOUBLE_EQ(objects[0].bbox.y1, 0.1);
  EXPECT_DOUBLE_EQ(objects[0].bbox.y2, 0.8);
  EXPECT_TRUE(objects[0].visible);

  EXPECT_EQ(objects[1].class_id, 1);
}

TEST(PostprocessTest, LoadClassNamesTrimsAndSkipsBlankLines) {
  const fs::path path = fs::path(::testing::TempDir()) / "annokit_classes.txt";
  {
    std::ofstream out(path);
    out << "person\n  car \n\n\tdog\r\n";
  }
  EXPECT_EQ(Postprocess::loadClassNames(path.string()),
            (std::vector<std::string>{"person", "car", "dog"}));
  fs::remove(path);
  EXPECT_TRUE(Postprocess::loadClassNames(path.string()).empty());
}
