#include "fake_transport.hpp"

#include <wolgate/waker.hpp>

#include <gtest/gtest.h>

#include <sstream>

static Registry make_registry(const std::string& text) {
    std::istringstream in{text};
    return std::get<Registry>(Registry::parse(in, "test"));
}

class WakerTest : public ::testing::Test {
  protected:
    RegistryHandle registry_{make_registry(
        "desk,Office Desktop,AA:BB:CC:DD:EE:01,192.168.1.255\n"
        "nas,Home NAS,aa-bb-cc-dd-ee-03\n"
        "broken,Broken,ZZ:ZZ:ZZ:ZZ:ZZ:ZZ\n"
        "zero,Zero,00:00:00:00:00:00\n")};
    FakeTransport transport_;
    Dispatcher dispatcher_{transport_};
    Waker waker_{registry_, dispatcher_, WakeDefaults{"10.0.0.255", 9}};
};

TEST_F(WakerTest, WakesRegisteredDevice) {
    auto result = waker_.wake("desk");
    EXPECT_EQ(result.status, WakeStatus::Success);
    EXPECT_EQ(result.mac, "AA:BB:CC:DD:EE:01");
    EXPECT_EQ(result.destination, "192.168.1.255:9");

    ASSERT_EQ(transport_.sent.size(), 1u);
    const auto& dgram = transport_.sent[0];
    EXPECT_EQ(dgram.dest.address, "192.168.1.255");
    EXPECT_EQ(dgram.dest.port, 9);
    ASSERT_EQ(dgram.payload.size(), 102u);
    for (size_t i = 0; i < 6; ++i) {
        EXPECT_EQ(dgram.payload[i], 0xff);
    }
    const std::vector<uint8_t> mac = {0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0x01};
    EXPECT_EQ(std::vector<uint8_t>(dgram.payload.begin() + 6, dgram.payload.begin() + 12), mac);
    EXPECT_EQ(exit_code(result.status), 0);
}

TEST_F(WakerTest, UsesDefaultBroadcast) {
    auto result = waker_.wake("nas");
    EXPECT_EQ(result.status, WakeStatus::Success);
    ASSERT_EQ(transport_.sent.size(), 1u);
    EXPECT_EQ(transport_.sent[0].dest.address, "10.0.0.255");
}

TEST_F(WakerTest, UnknownDeviceDoesNoNetworkIO) {
    auto result = waker_.wake("nonexistent");
    EXPECT_EQ(result.status, WakeStatus::UnknownDevice);
    EXPECT_EQ(transport_.calls, 0);
    EXPECT_EQ(describe(result), "Unknown device key: nonexistent");
    EXPECT_EQ(exit_code(result.status), 3);
}

TEST_F(WakerTest, KeyIsNeverInterpreted) {
    for (const auto* key : {"desk; reboot", "../desk", "DESK", "desk ", "Office Desktop", ""}) {
        EXPECT_EQ(waker_.wake(key).status, WakeStatus::UnknownDevice) << key;
    }
    EXPECT_EQ(transport_.calls, 0);
}

TEST_F(WakerTest, InvalidAddressNeverReachesDispatcher) {
    auto result = waker_.wake("broken");
    EXPECT_EQ(result.status, WakeStatus::InvalidAddress);
    EXPECT_EQ(transport_.calls, 0);
    EXPECT_NE(describe(result).find("ZZ:ZZ:ZZ:ZZ:ZZ:ZZ"), std::string::npos);
    EXPECT_EQ(exit_code(result.status), 2);
}

TEST_F(WakerTest, SuspiciousAddressIsReportedDistinctly) {
    auto result = waker_.wake("zero");
    EXPECT_EQ(result.status, WakeStatus::SuspiciousAddress);
    EXPECT_EQ(transport_.calls, 0);
}

TEST_F(WakerTest, NetworkErrorCarriesCause) {
    transport_.fail_at = 1;
    transport_.error = "failed to send to 192.168.1.255:9: Network is unreachable";
    auto result = waker_.wake("desk");
    EXPECT_EQ(result.status, WakeStatus::NetworkError);
    EXPECT_EQ(result.detail, transport_.error);
    EXPECT_NE(describe(result).find("Network is unreachable"), std::string::npos);
    EXPECT_EQ(exit_code(result.status), 1);
}

TEST_F(WakerTest, SuccessMessageDoesNotClaimWake) {
    auto message = describe(waker_.wake("desk"));
    EXPECT_NE(message.find("Office Desktop"), std::string::npos);
    EXPECT_NE(message.find("not confirmed"), std::string::npos);
}

TEST_F(WakerTest, SeesReplacedRegistry) {
    registry_.replace(make_registry("desk,Office Desktop,AA:BB:CC:DD:EE:02\n"));
    auto result = waker_.wake("desk");
    EXPECT_EQ(result.status, WakeStatus::Success);
    EXPECT_EQ(result.mac, "AA:BB:CC:DD:EE:02");
    EXPECT_EQ(waker_.wake("nas").status, WakeStatus::UnknownDevice);
}

TEST(WakeStatus, Names) {
    EXPECT_EQ(to_string(WakeStatus::Success), "Success");
    EXPECT_EQ(to_string(WakeStatus::UnknownDevice), "UnknownDevice");
    EXPECT_EQ(to_string(WakeStatus::InvalidAddress), "InvalidAddress");
    EXPECT_EQ(to_string(WakeStatus::NetworkError), "NetworkError");
}

TEST_F(WakerTest, UnknownKeyIsEscapedInMessage) {
    auto result = waker_.wake("desk\nwoke device 'nas'");
    EXPECT_EQ(result.status, WakeStatus::UnknownDevice);
    auto message = describe(result);
    EXPECT_EQ(message.find('\n'), std::string::npos);
    EXPECT_EQ(message, "Unknown device key: desk\\nwoke device \\'nas\\'");
    EXPECT_EQ(transport_.calls, 0);
}
