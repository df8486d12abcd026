/**
 * @file test_source_name.cpp
 * @brief Representative source name resolution tests
 */

#include "proofrank/heuristics.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

using proofrank::heuristics::is_spec_file;
using proofrank::heuristics::resolve_source_name;

namespace {

std::string fold(const std::vector<std::string_view>& candidates)
{
    std::string current;
    for (const auto candidate : candidates) {
        current = resolve_source_name(current, candidate);
    }
    return current;
}

}  // namespace

TEST(SourceName, EmptyAdoptsCandidate)
{
    EXPECT_EQ(resolve_source_name("", "pkg-child.adb"), "pkg-child.adb");
}

TEST(SourceName, ShorterCandidateWins)
{
    EXPECT_EQ(resolve_source_name("pkg-child.adb", "pkg.ads"), "pkg.ads");
    EXPECT_EQ(resolve_source_name("pkg-child.adb", "pkg.adb"), "pkg.adb");
}

TEST(SourceName, LongerNonSpecKeepsCurrent)
{
    EXPECT_EQ(resolve_source_name("pkg.ads", "pkg-child.adb"), "pkg.ads");
    EXPECT_EQ(resolve_source_name("pkg.adb", "pkg.adb"), "pkg.adb");
}

TEST(SourceName, SpecPreferredAtEqualOrGreaterLength)
{
    EXPECT_EQ(resolve_source_name("pkg.adb", "pkg.ads"), "pkg.ads");
    EXPECT_EQ(resolve_source_name("pkg.adb", "pkg.ADS"), "pkg.ADS");
    EXPECT_EQ(resolve_source_name("pkg.adb", "pkg-child.Ads"), "pkg-child.Ads");
}

TEST(SourceName, ShorterBodyDisplacesAdoptedSpec)
{
    // Only the candidate is inspected: an adopted spec loses to a shorter body.
    EXPECT_EQ(resolve_source_name("pkg-child.ads", "pkg.adb"), "pkg.adb");
    EXPECT_EQ(fold({"pkg.adb", "pkg-child.ads", "p.adb"}), "p.adb");
}

TEST(SourceName, FoldIsOrderSensitive)
{
    EXPECT_EQ(fold({"pkg-child.adb", "pkg.ads"}), "pkg.ads");
    EXPECT_EQ(fold({"pkg.ads", "pkg-child.adb"}), "pkg.ads");
    EXPECT_EQ(fold({"pkg.adb", "pkg.ads"}), "pkg.ads");
    EXPECT_EQ(fold({"pkg.ads", "pkg.adb"}), "pkg.ads");
    EXPECT_EQ(fold({"pkg-sep.ads", "pkg.adb"}), "pkg.adb");
    EXPECT_EQ(fold({"pkg.adb", "pkg-sep.ads"}), "pkg-sep.ads");
}

TEST(SourceName, SpecExtensionDetection)
{
    EXPECT_TRUE(is_spec_file("pkg.ads"));
    EXPECT_TRUE(is_spec_file("PKG.ADS"));
    EXPECT_TRUE(is_spec_file("src/pkg.Ads"));
    EXPECT_FALSE(is_spec_file("pkg.adb"));
    EXPECT_FALSE(is_spec_file("pkg"));
    EXPECT_FALSE(is_spec_file("ads"));
    EXPECT_FALSE(is_spec_file("pkg.ads.bak"));
}
