#include "slimetrack/tracker/Identity.hpp"
#include "slimetrack/tracker/TrackerConfig.hpp"

namespace slimetrack::tracker {

expected<void, std::string> Identity::validate() const {
    if (firmwareVersion.empty()) {
        return unexpected(std::string("firmware version is empty"));
    }
    if (firmwareVersion.size() > 255) {
        return unexpected("firmware version is " + std::to_string(firmwareVersion.size())
            + " characters, at most 255 fit in a handshake");
    }
    for (char c : firmwareVersion) {
        const auto u = static_cast<unsigned char>(c);
        if (u < 0x20 || u > 0x7E) {
            return unexpected(std::string("firmware version must be printable ASCII"));
        }
    }
    return {};
}

protocol::Handshake Identity::handshake() const {
    protocol::Handshake h;
    h.board = board;
    h.imu = protocol::ImuType::Unknown;
    h.mcu = mcu;
    h.imuInfo = {0, 0, 0};
    h.build = config::HANDSHAKE_BUILD;
    h.firmware = firmwareVersion;
    h.mac = mac;
    return h;
}

} // namespace slimetrack::tracker
