#include "mac_address.hpp"
#include <gtest/gtest.h>

TEST(MacAddress, CanonicalizeUppercases)
{
    EXPECT_EQ("AA:BB:CC:DD:EE:01", canonicalize_mac("aa:bb:cc:dd:ee:01"));
    EXPECT_EQ("AA:BB:CC:DD:EE:01", canonicalize_mac("AA:BB:CC:DD:EE:01"));
}

TEST(MacAddress, CanonicalizeAcceptsDashes)
{
    EXPECT_EQ("AA:BB:CC:DD:EE:01", canonicalize_mac("aa-bb-cc-dd-ee-01"));
}

TEST(MacAddress, CanonicalizeRejectsMalformed)
{
    EXPECT_EQ("", canonicalize_mac(""));
    EXPECT_EQ("", canonicalize_mac("AA:BB:CC:DD:EE"));
    EXPECT_EQ("", canonicalize_mac("AA:BB:CC:DD:EE:0G"));
    EXPECT_EQ("", canonicalize_mac("AABBCCDDEE01"));
    EXPECT_EQ("", canonicalize_mac("AA.BB.CC.DD.EE.01"));
    EXPECT_EQ("", canonicalize_mac("AA:BB:CC:DD:EE:011"));
}

TEST(MacAddress, CanonicalizePrefix)
{
    EXPECT_EQ("CC:DD", canonicalize_mac_prefix("cc-dd"));
    EXPECT_EQ("CC:D", canonicalize_mac_prefix("cc:d"));
    EXPECT_EQ("", canonicalize_mac_prefix(""));
}
