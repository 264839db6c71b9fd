/**
 * @file test_filter_policy.cpp
 * @brief Unit tests for the filter policy grammar.
 */

#include "model/filter_policy.hpp"
#include "model/text_file.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace fleet_usage;

TEST(FilterPolicyTest, ParsesAllKeywords) {
    auto policy = parse_filter_policy(R"(
# system accounts
ignore-user: root
ignore-user: sshuser   # gatherer account
ignore-proc: kworker
rename-proc: python3.11 -> python
)");
    ASSERT_TRUE(policy.has_value()) << policy.error().message;
    EXPECT_TRUE(policy->is_ignored_user("root"));
    EXPECT_TRUE(policy->is_ignored_user("sshuser"));
    EXPECT_FALSE(policy->is_ignored_user("ann"));
    EXPECT_TRUE(policy->is_ignored_process("kworker"));
    EXPECT_EQ(policy->canonical_name("python3.11"), "python");
    EXPECT_FALSE(policy->canonical_name("vim").has_value());
}

TEST(FilterPolicyTest, EmptyTextIsEmptyPolicy) {
    auto policy = parse_filter_policy("\n   \n# only comments\n");
    ASSERT_TRUE(policy.has_value());
    EXPECT_TRUE(policy->empty());
}

TEST(FilterPolicyTest, UnknownKeyword) {
    auto policy = parse_filter_policy("ignore-user: root\nignore-host: m1\n");
    ASSERT_FALSE(policy.has_value());
    EXPECT_EQ(policy.error().kind, ErrorKind::Config);
    EXPECT_NE(policy.error().message.find("line 2"), std::string::npos);
}

TEST(FilterPolicyTest, MalformedLines) {
    EXPECT_FALSE(parse_filter_policy("ignore-user root\n").has_value());
    EXPECT_FALSE(parse_filter_policy("ignore-user:\n").has_value());
    EXPECT_FALSE(parse_filter_policy("rename-proc: a b\n").has_value());
    EXPECT_FALSE(parse_filter_policy("rename-proc: a ->\n").has_value());
    EXPECT_FALSE(parse_filter_policy("rename-proc: -> b\n").has_value());
}

TEST(FilterPolicyTest, UnreadableFileFallsBackToEmpty) {
    auto policy = load_filter_policy_or_empty("/nonexistent/fleet_usage/policy");
    ASSERT_TRUE(policy.has_value());
    EXPECT_TRUE(policy->empty());

    EXPECT_FALSE(load_filter_policy("/nonexistent/fleet_usage/policy").has_value());
}

TEST(FilterPolicyTest, MalformedFileIsStillAnError) {
    auto path = std::filesystem::temp_directory_path() / "fleet_usage_test_policy";
    {
        std::ofstream out(path);
        out << "ignore-everything: yes\n";
    }
    auto policy = load_filter_policy_or_empty(path);
    std::filesystem::remove(path);
    ASSERT_FALSE(policy.has_value());
    EXPECT_EQ(policy.error().kind, ErrorKind::Config);
}

TEST(FilterPolicyTest, DirectoryIsNotAPolicyFile) {
    auto dir = std::filesystem::temp_directory_path() / "fleet_usage_test_policy_dir";
    std::filesystem::create_directories(dir);
    auto strict = load_filter_policy(dir);
    auto lenient = load_filter_policy_or_empty(dir);
    std::filesystem::remove_all(dir);

    ASSERT_FALSE(strict.has_value());
    EXPECT_EQ(strict.error().kind, ErrorKind::Config);
    // The sampler treats an unreadable policy as no policy.
    ASSERT_TRUE(lenient.has_value());
    EXPECT_TRUE(lenient->empty());
}

TEST(FilterPolicyTest, TrimHandlesAllAsciiWhitespace) {
    EXPECT_EQ(trim(" \t ignore-user \r\n"), "ignore-user");
    EXPECT_EQ(trim("   "), "");
}
