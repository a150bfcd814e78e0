#include <wolgate/mac.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

static const MAC DESK = {0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0x01};

TEST(Normalize, SeparatorStyleAndCaseDoNotMatter) {
    const std::vector<std::string> inputs = {
        "AA:BB:CC:DD:EE:01",
        "aa:bb:cc:dd:ee:01",
        "AA-BB-CC-DD-EE-01",
        "aabbccddee01",
        "AaBbCcDdEe01",
        "aa:bb-cc:dd-ee:01",
        "  AA:BB:CC:DD:EE:01  ",
    };
    for (const auto& input : inputs) {
        auto result = normalize(input);
        ASSERT_TRUE(std::holds_alternative<MAC>(result)) << input;
        EXPECT_EQ(std::get<MAC>(result), DESK) << input;
    }
}

TEST(Normalize, KeepsOctetOrder) {
    auto result = normalize("01:23:45:67:89:ab");
    ASSERT_TRUE(std::holds_alternative<MAC>(result));
    EXPECT_EQ(std::get<MAC>(result), (MAC{0x01, 0x23, 0x45, 0x67, 0x89, 0xab}));
}

TEST(Normalize, RejectsMalformedInput) {
    const std::vector<std::string> inputs = {
        "",
        "AA:BB:CC:DD:EE",
        "AA:BB:CC:DD:EE:01:02",
        "AABBCCDDEE0",
        "AABBCCDDEE011",
        "ZZ:ZZ:ZZ:ZZ:ZZ:ZZ",
        "AA:BB:CC:DD:EE:0G",
        "AA.BB.CC.DD.EE.01",
        "AA BB CC DD EE 01",
        "0xAABBCCDDEE",
        "::::::",
    };
    for (const auto& input : inputs) {
        auto result = normalize(input);
        ASSERT_TRUE(std::holds_alternative<AddressError>(result)) << input;
        EXPECT_EQ(std::get<AddressError>(result), AddressError::Invalid) << input;
    }
}

TEST(Normalize, FlagsAllZeroAndBroadcastAsSuspicious) {
    for (const auto* input : {"00:00:00:00:00:00", "FF:FF:FF:FF:FF:FF", "ff-ff-ff-ff-ff-ff"}) {
        auto result = normalize(input);
        ASSERT_TRUE(std::holds_alternative<AddressError>(result)) << input;
        EXPECT_EQ(std::get<AddressError>(result), AddressError::Suspicious) << input;
    }
}

TEST(MacToString, UpperCaseColonForm) {
    EXPECT_EQ(to_string(MAC{0x0a, 0xbb, 0xcc, 0xdd, 0xee, 0x01}), "0A:BB:CC:DD:EE:01");
}
