/**
 * @file test_owner.cpp
 * @brief Unit tests for owner-note parsing.
 */

#include "model/owner.hpp"

#include <gtest/gtest.h>

using namespace fleet_usage;

TEST(OwnerTest, EmptyNoteIsUnowned) {
    EXPECT_EQ(parse_owner(""), OwnerTag{});
    EXPECT_EQ(parse_owner("   \t").kind, OwnerKind::Unowned);
}

TEST(OwnerTest, PlainNameIsMember) {
    auto owner = parse_owner("  Dana Scully ");
    EXPECT_EQ(owner.kind, OwnerKind::Member);
    EXPECT_EQ(owner.name, "Dana Scully");
}

TEST(OwnerTest, StudentSuffix) {
    auto owner = parse_owner("Ann (Student)");
    EXPECT_EQ(owner.kind, OwnerKind::Student);
    EXPECT_EQ(owner.name, "Ann");
}

TEST(OwnerTest, VisitorSuffix) {
    auto owner = parse_owner("Bob(Visitor)");
    EXPECT_EQ(owner.kind, OwnerKind::Visitor);
    EXPECT_EQ(owner.name, "Bob");
}

TEST(OwnerTest, ReservationMarker) {
    EXPECT_EQ(parse_owner("Reservation Required"),
              (OwnerTag{.kind = OwnerKind::Reserved, .name = {}}));
}

TEST(OwnerTest, MarkerWithoutNameIsUnowned) {
    EXPECT_EQ(parse_owner("(Student)").kind, OwnerKind::Unowned);
    EXPECT_EQ(parse_owner("  (Visitor)").kind, OwnerKind::Unowned);
}

TEST(OwnerTest, MarkerInTheMiddleIsPartOfName) {
    auto owner = parse_owner("(Student) Ann");
    EXPECT_EQ(owner.kind, OwnerKind::Member);
    EXPECT_EQ(owner.name, "(Student) Ann");
}

TEST(OwnerTest, OwnerName) {
    auto student = parse_owner("Ann (Student)");
    auto member = parse_owner("Carl");
    auto reserved = parse_owner("Reservation Required");
    EXPECT_EQ(owner_name(student), "Ann");
    EXPECT_EQ(owner_name(member), "Carl");
    EXPECT_FALSE(owner_name(reserved).has_value());
    EXPECT_FALSE(owner_name(OwnerTag{}).has_value());
}

TEST(OwnerTest, KindNamesRoundTrip) {
    for (auto kind : {OwnerKind::Member, OwnerKind::Visitor, OwnerKind::Student,
                      OwnerKind::Reserved, OwnerKind::Unowned}) {
        EXPECT_EQ(parse_owner_kind(to_string(kind)), kind);
    }
    EXPECT_FALSE(parse_owner_kind("admin").has_value());
}
