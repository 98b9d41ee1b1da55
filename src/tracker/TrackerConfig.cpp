#include "slimetrack/tracker/TrackerConfig.hpp"

namespace slimetrack::tracker {

expected<void, std::string> ConnectionConfig::validate() const {
    if (serverAddress.empty()) {
        return unexpected(std::string("server address is empty"));
    }
    if (serverPort == 0) {
        return unexpected(std::string("server port must be non-zero"));
    }
    if (serverTimeout.count() <= 0) {
        return unexpected("server timeout must be positive, got "
            + std::to_string(serverTimeout.count()) + "ms");
    }
    if (sendTimeout.count() <= 0) {
        return unexpected("send timeout must be positive, got "
            + std::to_string(sendTimeout.count()) + "ms");
    }
    return {};
}

} // namespace slimetrack::tracker
