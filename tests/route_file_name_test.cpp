#include <gtest/gtest.h>

#include "core/media/RouteFileName.hpp"

using frl::parseRouteFileName;

TEST(RouteFileName, ParsesRouteSegmentAndCamera) {
  auto n = parseRouteFileName("2024-05-01--12-30-00-ecamera.mp4");
  ASSERT_TRUE(n);
  EXPECT_EQ(n->routeId, "2024-05-01");
  EXPECT_EQ(n->segment, "12-30-00");
  EXPECT_EQ(n->camera, "ecamera");
}

TEST(RouteFileName, IgnoresDirectory) {
  auto n = parseRouteFileName("/data/videos/abc--3-dcamera.mp4");
  ASSERT_TRUE(n);
  EXPECT_EQ(n->routeId, "abc");
  EXPECT_EQ(n->segment, "3");
  EXPECT_EQ(n->camera, "dcamera");
}

TEST(RouteFileName, RouteIdTakesEverythingBeforeTheLastDoubleDash) {
  auto n = parseRouteFileName("a--b--c-d.mp4");
  ASSERT_TRUE(n);
  EXPECT_EQ(n->routeId, "a--b");
  EXPECT_EQ(n->segment, "c");
  EXPECT_EQ(n->camera, "d");
}

TEST(RouteFileName, EmptySegmentIsAllowed) {
  auto n = parseRouteFileName("route---fcamera.mp4");
  ASSERT_TRUE(n);
  EXPECT_EQ(n->routeId, "route");
  EXPECT_EQ(n->segment, "");
  EXPECT_EQ(n->camera, "fcamera");
}

TEST(RouteFileName, RejectsNamesOutsideTheConvention) {
  EXPECT_FALSE(parseRouteFileName("route-ecamera.mp4"));     // no "--"
  EXPECT_FALSE(parseRouteFileName("route--1-ecamera.mkv"));  // wrong extension
  EXPECT_FALSE(parseRouteFileName("route--1-.mp4"));         // empty camera
  EXPECT_FALSE(parseRouteFileName("--1-ecamera.mp4"));       // empty route
  EXPECT_FALSE(parseRouteFileName(".mp4"));
  EXPECT_FALSE(parseRouteFileName("route--1-ecamera.mp4.tmp"));
}

TEST(RouteFileName, UploadRouteIdMatchesWhatTheSavedVideoParsesTo) {
  EXPECT_EQ(frl::uploadRouteId("2024-05-01--12-30-00").value_or(""), "2024-05-01");
  EXPECT_EQ(frl::uploadRouteId("a--b--c").value_or(""), "a--b");
  EXPECT_FALSE(frl::uploadRouteId("plainroute"));
  EXPECT_FALSE(frl::uploadRouteId(""));

  auto parsed = parseRouteFileName("2024-05-01--12-30-00-ecamera.mp4");
  ASSERT_TRUE(parsed);
  EXPECT_EQ(frl::uploadRouteId("2024-05-01--12-30-00").value_or(""), parsed->routeId);
}
