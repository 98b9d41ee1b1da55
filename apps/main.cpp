#include "slimetrack/tracker/EmulatedTracker.hpp"
#include "slimetrack/log/Log.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>

using namespace slimetrack;
using namespace slimetrack::tracker;

namespace {

bool parsePort(const std::string& text, std::uint16_t& out) {
    try {
        std::size_t used = 0;
        const int value = std::stoi(text, &used);
        if (used != text.size() || value <= 0 || value > 65535) {
            return false;
        }
        out = static_cast<std::uint16_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

protocol::Quaternion yawRotation(float angle) {
    // Rotation about the vertical (y) axis.
    return protocol::Quaternion{0.0f, std::sin(angle * 0.5f), 0.0f, std::cos(angle * 0.5f)};
}

} // namespace

int main(int argc, char** argv) {
    ConnectionConfig config;
    if (argc > 1) {
        config.serverAddress = argv[1];
    }
    if (argc > 2 && !parsePort(argv[2], config.serverPort)) {
        std::cerr << "usage: " << argv[0] << " [server-host] [port]\n";
        return 2;
    }

    Identity identity;
    identity.mac = {0x02, 0x53, 0x4C, 0x4D, 0x45, 0x01};
    identity.firmwareVersion = "slimetrack-emulator";
    identity.board = protocol::BoardType::Custom;
    identity.mcu = protocol::McuType::Esp32;

    EmulatedTracker tracker(identity, config);

    // 1) Discover the server. Blocks until it answers the handshake.
    std::cout << "Looking for a server at " << config.serverAddress << ":" << config.serverPort << "..." << std::endl;
    if (auto r = tracker.init(); !r) {
        const auto err = r.error();
        std::cerr << "Init failed: " << err.message()
                  << " (" << err.category().name() << ":" << err.value() << ")\n";
        return 1;
    }
    std::cout << "Status: " << toString(tracker.getState().status) << std::endl;

    // 2) Announce two sensors.
    for (auto imu : {protocol::ImuType::Bno085, protocol::ImuType::Bno085}) {
        if (auto r = tracker.addSensor(imu); !r) {
            std::cerr << "addSensor failed: " << r.error().message() << "\n";
        }
    }

    // 3) Stream synthetic telemetry for 30 seconds at ~50 Hz.
    constexpr auto kFrame = std::chrono::milliseconds(20);
    constexpr int kFrames = 30 * 50;
    const float tau = 2.0f * static_cast<float>(std::acos(-1.0));

    for (int frame = 0; frame < kFrames; ++frame) {
        if (tracker.getState().status == SessionStatus::Initializing) {
            std::cout << "Server went quiet, reconnecting..." << std::endl;
            if (auto r = tracker.init(); !r) {
                std::cerr << "Reconnect failed: " << r.error().message() << "\n";
                return 1;
            }
        }

        const float t = static_cast<float>(frame) / 250.0f;   // one turn every 5 s
        const float angle = t * tau;

        for (const auto& sensor : tracker.sensors()) {
            const float phase = angle + static_cast<float>(sensor.sensorId) * 0.5f;
            if (auto r = tracker.sendRotation(sensor.sensorId, protocol::SensorDataType::Normal,
                                              yawRotation(phase), 3); !r) {
                logError("rotation send failed: ", r.error().message(), "\n");
            }
            if (auto r = tracker.sendAcceleration(sensor.sensorId,
                                                  {std::cos(phase) * 0.1f, 0.0f, std::sin(phase) * 0.1f}); !r) {
                logError("acceleration send failed: ", r.error().message(), "\n");
            }
        }

        if (frame % 250 == 0) {
            const float level = 1.0f - static_cast<float>(frame) / static_cast<float>(kFrames) * 0.2f;
            if (auto r = tracker.sendBatteryLevel(level, 3.7f + level * 0.5f); !r) {
                logError("battery send failed: ", r.error().message(), "\n");
            }
            if (auto r = tracker.sendSignalStrength(0, -55); !r) {
                logError("signal strength send failed: ", r.error().message(), "\n");
            }
            if (auto r = tracker.sendTemperature(0, 31.5f); !r) {
                logError("temperature send failed: ", r.error().message(), "\n");
            }
        }

        std::this_thread::sleep_for(kFrame);
    }

    // 4) Tell the server the wearer reset, then leave.
    if (auto r = tracker.sendUserAction(protocol::ActionType::Reset); !r) {
        logError("user action send failed: ", r.error().message(), "\n");
    }
    if (auto r = tracker.deinit(); !r) {
        std::cerr << "Deinit failed: " << r.error().message() << "\n";
    }
    std::cout << "Done. Sent " << tracker.getState().packetNumber << " packets." << std::endl;

    return 0;
}
