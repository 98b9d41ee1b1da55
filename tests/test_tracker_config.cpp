#include "slimetrack/core/Error.hpp"
#include "slimetrack/tracker/Identity.hpp"
#include "slimetrack/tracker/TrackerConfig.hpp"
#include "support/TestMacros.hpp"

#include <string>
#include <system_error>

using namespace slimetrack;
using namespace slimetrack::tracker;

static Identity validIdentity() {
    Identity id;
    id.mac = {0x02, 0, 0, 0, 0, 0x07};
    id.firmwareVersion = "emu-0.1";
    id.board = protocol::BoardType::Custom;
    id.mcu = protocol::McuType::Esp32;
    return id;
}

static void testIdentityValidation() {
    ASSERT_TRUE(validIdentity().validate().has_value(), "valid identity accepted");

    auto id = validIdentity();
    id.firmwareVersion.clear();
    ASSERT_TRUE(!id.validate().has_value(), "empty firmware rejected");

    id.firmwareVersion = std::string(255, 'a');
    ASSERT_TRUE(id.validate().has_value(), "255 characters fit");
    id.firmwareVersion.push_back('a');
    ASSERT_TRUE(!id.validate().has_value(), "256 characters rejected");

    id.firmwareVersion = "caf\xC3\xA9";
    ASSERT_TRUE(!id.validate().has_value(), "non-ascii rejected");
    id.firmwareVersion = "line\nbreak";
    ASSERT_TRUE(!id.validate().has_value(), "control characters rejected");
}

static void testHandshakeFromIdentity() {
    const auto id = validIdentity();
    const auto h = id.handshake();
    ASSERT_TRUE(h.board == protocol::BoardType::Custom, "board copied");
    ASSERT_TRUE(h.mcu == protocol::McuType::Esp32, "mcu copied");
    ASSERT_TRUE(h.imu == protocol::ImuType::Unknown, "imu always unknown");
    ASSERT_EQ(h.build, config::HANDSHAKE_BUILD, "build number");
    ASSERT_TRUE(h.firmware == "emu-0.1", "firmware copied");
    ASSERT_TRUE(h.mac == id.mac, "mac copied");
}

static void testConnectionConfig() {
    ConnectionConfig cfg;
    ASSERT_TRUE(cfg.serverAddress == "255.255.255.255", "broadcast by default");
    ASSERT_EQ(cfg.serverPort, std::uint16_t(6969), "default port");
    ASSERT_EQ(cfg.serverTimeout.count(), 5000, "default timeout");
    ASSERT_TRUE(!cfg.debug, "debug off by default");
    ASSERT_TRUE(cfg.validate().has_value(), "defaults are valid");

    auto bad = cfg;
    bad.serverAddress.clear();
    ASSERT_TRUE(!bad.validate().has_value(), "empty address rejected");

    bad = cfg;
    bad.serverPort = 0;
    ASSERT_TRUE(!bad.validate().has_value(), "port 0 rejected");

    bad = cfg;
    bad.serverTimeout = std::chrono::milliseconds(0);
    ASSERT_TRUE(!bad.validate().has_value(), "zero timeout rejected");

    bad = cfg;
    bad.sendTimeout = std::chrono::milliseconds(-5);
    ASSERT_TRUE(!bad.validate().has_value(), "negative send timeout rejected");
}

static void testErrorKinds() {
    const std::error_code notInit = make_error_code(Errc::NotInitialized);
    ASSERT_TRUE(notInit == ErrorKind::Precondition, "not-initialized is a precondition error");
    ASSERT_TRUE(notInit != ErrorKind::Transport, "not a transport error");
    ASSERT_TRUE(std::error_code(Errc::SendFailed) == ErrorKind::Transport, "send failure is transport");
    ASSERT_TRUE(std::error_code(Errc::EncodeFailed) == ErrorKind::Protocol, "encode failure is protocol");
    ASSERT_TRUE(std::error_code(Errc::Cancelled) == ErrorKind::Cancelled, "cancelled");
    ASSERT_TRUE(kindOf(Errc::SensorLimitReached) == ErrorKind::Precondition, "sensor limit is precondition");
    ASSERT_TRUE(!notInit.message().empty(), "codes carry a message");
}

int main() {
    testIdentityValidation();
    testHandshakeFromIdentity();
    testConnectionConfig();
    testErrorKinds();
    return reportAndExit("Tracker config");
}
