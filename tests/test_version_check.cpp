#include <gtest/gtest.h>
#include <optional>
#include <string>

#include "lazymc/config/version_check.hpp"

using version_check::version_status;

TEST(VersionCheck, OlderVersionIsOutdated){
    EXPECT_EQ(version_check::check(std::string("0.2.7"), "0.2.8"), version_status::outdated);
    EXPECT_EQ(version_check::check(std::string("0.1.99"), "0.2.8"), version_status::outdated);
}

TEST(VersionCheck, SameOrNewerIsCompatible){
    EXPECT_EQ(version_check::check(std::string("0.2.8"), "0.2.8"), version_status::compatible);
    EXPECT_EQ(version_check::check(std::string("0.2.9"), "0.2.8"), version_status::compatible);
    EXPECT_EQ(version_check::check(std::string("0.2.11"), "0.2.8"), version_status::compatible);
    EXPECT_EQ(version_check::check(std::string("1.0"), "0.2.8"), version_status::compatible);
}

TEST(VersionCheck, NumericNotLexicalOrder){
    // "0.2.10" < "0.2.8" as strings, but not as versions.
    EXPECT_EQ(version_check::check(std::string("0.2.10"), "0.2.8"), version_status::compatible);
    EXPECT_EQ(version_check::check(std::string("0.10.0"), "0.9.0"), version_status::compatible);
}

TEST(VersionCheck, InvalidVersion){
    EXPECT_EQ(version_check::check(std::string("not-a-version"), "0.2.8"), version_status::invalid);
    EXPECT_EQ(version_check::check(std::string(""), "0.2.8"), version_status::invalid);
    EXPECT_EQ(version_check::check(std::string("0..2"), "0.2.8"), version_status::invalid);
}

TEST(VersionCheck, MissingVersionIsUnknown){
    EXPECT_EQ(version_check::check(std::nullopt, "0.2.8"), version_status::unknown);
}

TEST(VersionCheck, DefaultMinimum){
    EXPECT_EQ(version_check::check(std::string("0.2.7")), version_status::outdated);
    EXPECT_EQ(version_check::check(std::string("0.2.9")), version_status::compatible);
}

TEST(VersionCheck, ParseAndCompare){
    auto a = version_check::parse_version("v0.2.8-beta");
    auto b = version_check::parse_version("0.2.8.0");
    ASSERT_TRUE(a && b);
    EXPECT_EQ(version_check::compare(*a, *b), 0);

    auto c = version_check::parse_version("0.3");
    ASSERT_TRUE(c);
    EXPECT_LT(version_check::compare(*a, *c), 0);
    EXPECT_GT(version_check::compare(*c, *a), 0);
}

TEST(VersionCheck, WarningMessages){
    EXPECT_TRUE(version_check::warning_message(version_status::compatible).empty());
    EXPECT_EQ(version_check::warning_message(version_status::unknown), "Config version unknown, it may be outdated");
    EXPECT_EQ(
        version_check::warning_message(version_status::outdated),
        "Config is for older lazymc version, you may need to update it"
    );
    EXPECT_EQ(
        version_check::warning_message(version_status::invalid),
        "Config version is invalid, you may need to update it"
    );
    EXPECT_EQ(version_check::warn_if_incompatible(std::string("0.2.7")), version_status::outdated);
}
