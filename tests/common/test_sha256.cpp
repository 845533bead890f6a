/**
 * @file test_sha256.cpp
 * @brief SHA-256 and hash-derived URN tests
 */

#include "kcfgvex/common.hpp"
#include <gtest/gtest.h>

#include <regex>

using namespace kcfgvex::common;

TEST(SHA256, EmptyString) {
    // SHA-256 of empty string is well-known
    EXPECT_EQ(sha256(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256, HelloWorld) {
    EXPECT_EQ(sha256("Hello, World!"), "dffd6021bb2bd5b0af676290809ec3a53191dd81c7f70a4b28688a362182986f");
}

TEST(SHA256, Prefixed) {
    std::string hash = sha256_prefixed("test");
    EXPECT_TRUE(hash.starts_with("sha256:"));
    EXPECT_EQ(hash.length(), 7 + 64);
}

TEST(SHA256, DifferentInputs) {
    EXPECT_NE(sha256("a"), sha256("b"));
    EXPECT_NE(sha256("abc"), sha256("ABC"));
}

TEST(UuidUrn, ShapeAndVersion) {
    const std::string urn = uuid_urn_from_hash("[{\"id\":\"CVE-2024-0001\"}]");
    const std::regex shape("^urn:uuid:[0-9a-f]{8}-[0-9a-f]{4}-5[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    EXPECT_TRUE(std::regex_match(urn, shape)) << urn;
}

TEST(UuidUrn, SameInputSameUrn) {
    EXPECT_EQ(uuid_urn_from_hash("vulnerabilities"), uuid_urn_from_hash("vulnerabilities"));
    EXPECT_NE(uuid_urn_from_hash("vulnerabilities"), uuid_urn_from_hash("vulnerabilities "));
}
