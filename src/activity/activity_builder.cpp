#include "presencelink/activity/activity_builder.hpp"

#include <chrono>

namespace presencelink {
namespace activity {

ActivityBuilder& ActivityBuilder::state(std::string value) {
    activity_.state_ = std::move(value);
    return *this;
}

ActivityBuilder& ActivityBuilder::details(std::string value) {
    activity_.details_ = std::move(value);
    return *this;
}

ActivityBuilder& ActivityBuilder::startTimestampNow() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now).count();
    // Clocks set before 1970 report 0 rather than wrapping.
    return startTimestamp(seconds > 0 ? static_cast<uint64_t>(seconds) : 0);
}

ActivityBuilder& ActivityBuilder::startTimestamp(uint64_t epochSeconds) {
    timestamps().start = epochSeconds;
    return *this;
}

ActivityBuilder& ActivityBuilder::endTimestamp(uint64_t epochSeconds) {
    timestamps().end = epochSeconds;
    return *this;
}

ActivityBuilder& ActivityBuilder::largeImage(std::string key) {
    assets().largeImage = std::move(key);
    return *this;
}

ActivityBuilder& ActivityBuilder::largeText(std::string text) {
    assets().largeText = std::move(text);
    return *this;
}

ActivityBuilder& ActivityBuilder::smallImage(std::string key) {
    assets().smallImage = std::move(key);
    return *this;
}

ActivityBuilder& ActivityBuilder::smallText(std::string text) {
    assets().smallText = std::move(text);
    return *this;
}

ActivityBuilder& ActivityBuilder::party(std::string id, uint32_t currentSize, uint32_t maxSize) {
    ActivityParty party;
    party.id = std::move(id);
    party.size = PartySize{currentSize, maxSize};
    activity_.party_ = std::move(party);
    return *this;
}

ActivityBuilder& ActivityBuilder::button(std::string label, std::string url) {
    activity_.buttons_.push_back(ActivityButton{std::move(label), std::move(url)});
    return *this;
}

ActivityBuilder& ActivityBuilder::joinSecret(std::string secret) {
    secrets().join = std::move(secret);
    return *this;
}

ActivityBuilder& ActivityBuilder::spectateSecret(std::string secret) {
    secrets().spectate = std::move(secret);
    return *this;
}

ActivityBuilder& ActivityBuilder::matchSecret(std::string secret) {
    secrets().match = std::move(secret);
    return *this;
}

ActivityBuilder& ActivityBuilder::instance(bool value) {
    activity_.instance_ = value;
    return *this;
}

ActivityTimestamps& ActivityBuilder::timestamps() {
    if (!activity_.timestamps_) {
        activity_.timestamps_.emplace();
    }
    return *activity_.timestamps_;
}

ActivityAssets& ActivityBuilder::assets() {
    if (!activity_.assets_) {
        activity_.assets_.emplace();
    }
    return *activity_.assets_;
}

ActivitySecrets& ActivityBuilder::secrets() {
    if (!activity_.secrets_) {
        activity_.secrets_.emplace();
    }
    return *activity_.secrets_;
}

} // namespace activity
} // namespace presencelink
