#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <sstream>

#include "annokit/common/StringUtils.hpp"
#include "annokit/output/YoloExport.hpp"

using annokit::output::ClassMap;
using annokit::output::ExportRecord;
using annokit::output::YoloExport;

namespace {

ExportRecord record(double x, double y, double w, double h, const std::string& name) {
  ExportRecord rec;
  rec.bbox = cv::Rect2d(x, y, w, h);
  rec.category_name = name;
  return rec;
}

std::vector<double> parseValues(const std::string& line) {
  std::istringstream in(line);
  int id = 0;
  in >> id;
  std::vector<double> values;
  double v = 0.0;
  while (in >> v) values.push_back(v);
  return values;
}

}  // namespace

TEST(YoloExportTest, SingleBoxSixDecimals) {
  const ClassMap map{{"person", 0}};
  const auto text = YoloExport::convert({record(0, 0, 100, 50, "person")}, 200, 100, map);
  EXPECT_EQ(text, "0 0.250000 0.250000 0.500000 0.500000");
}

TEST(YoloExportTest, LinesJoinedWithoutTrailingNewline) {
  const ClassMap map{{"person", 0}, {"car", 1}};
  const auto text = YoloExport::convert(
      {record(0, 0, 100, 50, "person"), record(100, 50, 100, 50, "car")}, 200, 100, map);
  EXPECT_EQ(text,
            "0 0.250000 0.250000 0.500000 0.500000\n"
            "1 0.750000 0.750000 0.500000 0.500000");
}

TEST(YoloExportTest, ClampsOutOfBoundsBox) {
  const ClassMap map{{"person", 0}};
  const auto text = YoloExport::convert({record(-20, -10, 140, 120, "person")}, 100, 100, map);
  const auto values = parseValues(text);
  ASSERT_EQ(values.size(), 4u);
  for (double v : values) {
    EXPECT_GE(v, 0.0);
    EXPECT_LE(v, 1.0);
  }
  EXPECT_DOUBLE_EQ(values[0], 0.5);
  EXPECT_DOUBLE_EQ(values[2], 1.0);
}

TEST(YoloExportTest, ClampsNegativeCenter) {
  const ClassMap map{{"person", 0}};
  const auto text = YoloExport::convert({record(-20, 0, 10, 10, "person")}, 100, 100, map);
  const auto values = parseValues(text);
  ASSERT_EQ(values.size(), 4u);
  EXPECT_DOUBLE_EQ(values[0], 0.0);
  EXPECT_EQ(text.find('-'), std::string::npos);
}

TEST(YoloExportTest, EmptyInputOrInvalidSizeYieldsEmptyString) {
  const ClassMap map{{"person", 0}};
  EXPECT_EQ(YoloExport::convert({}, 200, 100, map), "");
  EXPECT_EQ(YoloExport::convert({record(0, 0, 10, 10, "person")}, 0, 100, map), "");
  EXPECT_EQ(YoloExport::convert({record(0, 0, 10, 10, "person")}, 200, 0, map), "");
}

TEST(YoloExportTest, SkipsUnknownClassAndMalformedBox) {
  const ClassMap map{{"person", 0}};
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const auto text = YoloExport::convert({record(0, 0, 10, 10, "ghost"),
                                         record(0, 0, 10, 10, ""),
                                         record(nan, 0, 10, 10, "person"),
                                         record(0, 0, 100, 50, "person")},
                                        200, 100, map);
  EXPECT_EQ(text, "0 0.250000 0.250000 0.500000 0.500000");
}

TEST(YoloExportTest, EffectiveNamePrecedence) {
  ExportRecord rec;
  rec.original_class = "dog";
  EXPECT_EQ(rec.effectiveName(), "dog");
  rec.category_name = "animal";
  EXPECT_EQ(rec.effectiveName(), "animal");
  rec.user_label = "puppy";
  EXPECT_EQ(rec.effectiveName(), "puppy");
}

TEST(YoloExportTest, BuildClassMapKeepsFirstOccurrence) {
  const auto map = YoloExport::buildClassMap({"person", "car", "person"});
  ASSERT_EQ(map.size(), 2u);
  EXPECT_EQ(map.at("person"), 0);
  EXPECT_EQ(map.at("car"), 1);
}

TEST(YoloExportTest, ExportObjectSetIncludesHiddenObjects) {
  annokit::store::ObjectSet set({"person", "car"});
  set.add({0.0, 0.0, 0.5, 0.5}, 0);
  set.add({0.5, 0.5, 1.0, 1.0}, 1);
  set.toggleVisibility(1);

  const auto map = YoloExport::buildClassMap(set.classNames());
  const auto text = YoloExport::exportObjectSet(set, {200, 100}, map);
  EXPECT_EQ(text,
            "0 0.250000 0.250000 0.500000 0.500000\n"
            "1 0.750000 0.750000 0.500000 0.500000");
}

TEST(YoloExportTest, ExportObjectSetWithUnknownSizeIsEmpty) {
  annokit::store::ObjectSet set({"person"});
  set.add({0.0, 0.0, 0.5, 0.5}, 0);
  EXPECT_EQ(YoloExport::exportObjectSet(set, {0, 0}, YoloExport::buildClassMap(set.classNames())),
            "");
}

TEST(YoloExportTest, FormatLine) {
  EXPECT_EQ(YoloExport::formatLine(7, 0.1234567, 0.5, 1.0, 0.0),
            "7 0.123457 0.500000 1.000000 0.000000");
}

TEST(StringUtilsTest, SanitizeFilenameBase) {
  EXPECT_EQ(annokit::common::sanitizeFilenameBase("my image (1).v2"), "my_image__1__v2");
  EXPECT_EQ(annokit::common::sanitizeFilenameBase("ok_name-3"), "ok_name-3");
}
