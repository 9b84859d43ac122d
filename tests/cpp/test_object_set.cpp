#include <gtest/gtest.h>

#include "annokit/store/ObjectSet.hpp"

using annokit::geometry::NormBox;
using annokit::store::AnnotatedObject;
using annokit::store::ObjectSet;

namespace {

NormBox box(double offset) { return {offset, offset, offset + 0.1, offset + 0.1}; }

ObjectSet makeSet(size_t count) {
  ObjectSet set({"person", "car"});
  for (size_t i = 0; i < count; ++i) {
    set.add(box(0.05 * static_cast<double>(i)), static_cast<int>(i % 2));
  }
  return set;
}

}  // namespace

TEST(ObjectSetTest, AddAppendsVisibleWithFullConfidence) {
  ObjectSet set;
  const auto index = set.add(box(0.2), 3);
  ASSERT_TRUE(index.has_value());
  EXPECT_EQ(*index, 0u);
  ASSERT_EQ(set.size(), 1u);
  EXPECT_EQ(set.at(0)->class_id, 3);
  EXPECT_FLOAT_EQ(set.at(0)->confidence, 1.0f);
  EXPECT_TRUE(set.at(0)->visible);
  EXPECT_FALSE(set.at(0)->mask.has_value());
}

TEST(ObjectSetTest, AddRejectsNegativeClass) {
  ObjectSet set;
  EXPECT_FALSE(set.add(box(0.2), -1).has_value());
  EXPECT_TRUE(set.empty());
}

TEST(ObjectSetTest, UpdateKeepsMaskWhenNoneGiven) {
  ObjectSet set;
  set.add(box(0.1), 0, annokit::geometry::Mask{{1, 1}, {5, 1}, {3, 4}});
  ASSERT_TRUE(set.update(0, box(0.3)));
  EXPECT_DOUBLE_EQ(set.at(0)->bbox.x1, 0.3);
  ASSERT_TRUE(set.at(0)->mask.has_value());
  EXPECT_EQ(set.at(0)->mask->size(), 3u);

  ASSERT_TRUE(set.update(0, box(0.3), annokit::geometry::Mask{{0, 0}}));
  EXPECT_EQ(set.at(0)->mask->size(), 1u);
}

TEST(ObjectSetTest, OutOfRangeMutationsAreNoOps) {
  auto set = makeSet(2);
  EXPECT_FALSE(set.update(5, box(0.0)));
  EXPECT_FALSE(set.remove(2));
  EXPECT_FALSE(set.setClass(9, 1));
  EXPECT_FALSE(set.toggleVisibility(2));
  EXPECT_FALSE(set.select(7));
  EXPECT_EQ(set.at(2), nullptr);
  EXPECT_EQ(set.size(), 2u);
}

TEST(ObjectSetTest, SetClassRejectsNegative) {
  auto set = makeSet(1);
  EXPECT_FALSE(set.setClass(0, -2));
  EXPECT_TRUE(set.setClass(0, 1));
  EXPECT_EQ(set.at(0)->class_id, 1);
}

TEST(ObjectSetTest, SetClassStaysInsideVocabulary) {
  auto set = makeSet(1);
  EXPECT_FALSE(set.setClass(0, 2));
  EXPECT_EQ(set.at(0)->class_id, 0);

  ObjectSet open_set;
  open_set.add(box(0.1), 0);
  EXPECT_TRUE(open_set.setClass(0, 4));
}

TEST(ObjectSetTest, RemoveRenumbersHiddenIndices) {
  auto set = makeSet(4);
  set.toggleVisibility(1);
  set.toggleVisibility(3);
  EXPECT_EQ(set.hiddenIndices(), (std::vector<size_t>{1, 3}));

  ASSERT_TRUE(set.remove(2));
  EXPECT_EQ(set.hiddenIndices(), (std::vector<size_t>{1, 2}));

  ASSERT_TRUE(set.remove(1));
  EXPECT_EQ(set.hiddenIndices(), (std::vector<size_t>{1}));
  EXPECT_FALSE(set.isHidden(0));
  EXPECT_TRUE(set.isHidden(1));
}

TEST(ObjectSetTest, RemovingSelectedClearsSelection) {
  auto set = makeSet(3);
  ASSERT_TRUE(set.select(1));
  set.remove(1);
  EXPECT_FALSE(set.selectedIndex().has_value());
}

TEST(ObjectSetTest, SelectionFollowsObjectAcrossRemoval) {
  auto set = makeSet(3);
  ASSERT_TRUE(set.select(2));
  set.remove(0);
  ASSERT_TRUE(set.selectedIndex().has_value());
  EXPECT_EQ(*set.selectedIndex(), 1u);
}

TEST(ObjectSetTest, HidingSelectedClearsSelection) {
  auto set = makeSet(2);
  ASSERT_TRUE(set.select(0));
  ASSERT_TRUE(set.toggleVisibility(0));
  EXPECT_FALSE(set.selectedIndex().has_value());
  EXPECT_TRUE(set.isHidden(0));
}

TEST(ObjectSetTest, HiddenObjectsCannotBeSelected) {
  auto set = makeSet(2);
  set.toggleVisibility(1);
  EXPECT_FALSE(set.select(1));
  set.toggleVisibility(1);
  EXPECT_TRUE(set.select(1));
}

TEST(ObjectSetTest, ReplaceAllResetsState) {
  auto set = makeSet(3);
  set.toggleVisibility(0);
  set.select(1);
  set.setHovered(2);

  AnnotatedObject a;
  a.class_id = 1;
  a.visible = false;
  AnnotatedObject b;
  b.class_id = 0;
  set.replaceAll({a, b});

  ASSERT_EQ(set.size(), 2u);
  EXPECT_TRUE(set.hiddenIndices().empty());
  EXPECT_FALSE(set.selectedIndex().has_value());
  EXPECT_FALSE(set.hoveredIndex().has_value());
  EXPECT_NE(set.at(0)->id, set.at(1)->id);
}

TEST(ObjectSetTest, IdsAreStableAndUnique) {
  auto set = makeSet(3);
  const auto id = set.at(2)->id;
  set.remove(0);
  ASSERT_TRUE(set.indexOf(id).has_value());
  EXPECT_EQ(*set.indexOf(id), 1u);
  const auto added = set.add(box(0.5), 0);
  EXPECT_NE(set.at(*added)->id, id);
}

TEST(ObjectSetTest, HoverTracksObject) {
  auto set = makeSet(2);
  set.setHovered(1);
  EXPECT_EQ(set.hoveredIndex(), std::optional<size_t>(1));
  set.setHovered(std::nullopt);
  EXPECT_FALSE(set.hoveredIndex().has_value());
  set.setHovered(9);
  EXPECT_FALSE(set.hoveredIndex().has_value());
}

TEST(ObjectSetTest, ClassVocabulary) {
  ObjectSet set({"person", "car"});
  EXPECT_EQ(set.className(1), "car");
  EXPECT_EQ(set.className(5), "");
  EXPECT_EQ(set.className(-1), "");
  EXPECT_EQ(set.resolveClass("car"), 1);
  EXPECT_EQ(set.resolveClass("dog"), 2);
  EXPECT_EQ(set.classNames().size(), 3u);
}

TEST(ObjectSetTest, ClassCounts) {
  auto set = makeSet(5);
  const auto counts = set.classCounts();
  EXPECT_EQ(counts.at(0), 3);
  EXPECT_EQ(counts.at(1), 2);
}

TEST(ObjectSetTest, ClearEmptiesEverything) {
  auto set = makeSet(2);
  set.select(0);
  set.clear();
  EXPECT_TRUE(set.empty());
  EXPECT_FALSE(set.selectedIndex().has_value());
}
