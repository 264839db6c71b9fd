/**
 * @file test_roster.cpp
 * @brief Unit tests for roster parsing.
 */

#include "model/roster.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace fleet_usage;

TEST(RosterTest, RoomsAndNotes) {
    auto roster = parse_roster(R"(
# fleet roster
[lab]
m1: Ann (Student)
m2:

[office]   # second floor
m3: Carl   # desk by the window
m4: Reservation Required
)");
    ASSERT_TRUE(roster.has_value()) << roster.error().message;
    ASSERT_EQ(roster->size(), 4u);

    EXPECT_EQ((*roster)[0], (MachineIdentity{
        .hostname = "m1", .room = "lab",
        .owner = {.kind = OwnerKind::Student, .name = "Ann"}}));
    EXPECT_EQ((*roster)[1].owner.kind, OwnerKind::Unowned);
    EXPECT_EQ((*roster)[2].room, "office");
    EXPECT_EQ((*roster)[2].owner.name, "Carl");
    EXPECT_EQ((*roster)[3].owner.kind, OwnerKind::Reserved);
}

TEST(RosterTest, EntriesBeforeHeaderAreOrphans) {
    auto roster = parse_roster("lonely: Dana\n[lab]\nm1:\n");
    ASSERT_TRUE(roster.has_value());
    EXPECT_EQ((*roster)[0].room, kOrphanRoom);
    EXPECT_EQ((*roster)[1].room, "lab");
}

TEST(RosterTest, CrlfLineEndings) {
    auto roster = parse_roster("[lab]\r\nm1: Ann\r\n");
    ASSERT_TRUE(roster.has_value());
    EXPECT_EQ((*roster)[0].owner.name, "Ann");
}

TEST(RosterTest, MissingColonReportsLine) {
    auto roster = parse_roster("[lab]\nm1 Ann\n");
    ASSERT_FALSE(roster.has_value());
    EXPECT_EQ(roster.error().kind, ErrorKind::Config);
    EXPECT_NE(roster.error().message.find("line 2"), std::string::npos);
    EXPECT_NE(roster.error().message.find("m1 Ann"), std::string::npos);
}

TEST(RosterTest, MalformedLinesAreErrors) {
    EXPECT_FALSE(parse_roster("[lab\n").has_value());
    EXPECT_FALSE(parse_roster("[  ]\n").has_value());
    EXPECT_FALSE(parse_roster(": Ann\n").has_value());
    EXPECT_FALSE(parse_roster("m 1: Ann\n").has_value());
}

TEST(RosterTest, LoadMissingFile) {
    auto roster = load_roster("/nonexistent/fleet_usage/roster.ini");
    ASSERT_FALSE(roster.has_value());
    EXPECT_EQ(roster.error().kind, ErrorKind::Config);
}

TEST(RosterTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "fleet_usage_test_roster.ini";
    {
        std::ofstream out(path);
        out << "[lab]\nm1: Ann (Student)\nm2:\n";
    }
    auto roster = load_roster(path);
    std::filesystem::remove(path);
    ASSERT_TRUE(roster.has_value());
    EXPECT_EQ(roster->size(), 2u);
}

TEST(RosterTest, LoadDirectoryIsError) {
    auto dir = std::filesystem::temp_directory_path() / "fleet_usage_test_roster_dir";
    std::filesystem::create_directories(dir);
    auto roster = load_roster(dir);
    std::filesystem::remove_all(dir);

    ASSERT_FALSE(roster.has_value());
    EXPECT_EQ(roster.error().kind, ErrorKind::Config);
    EXPECT_NE(roster.error().root_cause().find("not a regular file"), std::string::npos);
}

TEST(RosterTest, LoadEmptyFileIsEmptyRoster) {
    auto path = std::filesystem::temp_directory_path() / "fleet_usage_test_roster_empty.ini";
    { std::ofstream out(path); }
    auto roster = load_roster(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(roster.has_value());
    EXPECT_TRUE(roster->empty());
}
