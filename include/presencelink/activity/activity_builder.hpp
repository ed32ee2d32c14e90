#pragma once

#include <cstdint>
#include <string>

#include "presencelink/activity/activity.hpp"

namespace presencelink {
namespace activity {

/**
 * @brief Accumulates fields and produces an Activity with build().
 *
 * Setters do not validate; validation happens when the activity is sent.
 *
 * @code
 * auto activity = ActivityBuilder()
 *     .state("In a match")
 *     .details("Ranked")
 *     .startTimestampNow()
 *     .largeImage("map_icon")
 *     .button("Website", "https://example.com")
 *     .build();
 * @endcode
 */
class ActivityBuilder {
public:
    ActivityBuilder() = default;

    ActivityBuilder& state(std::string value);
    ActivityBuilder& details(std::string value);

    /// Start timestamp set to the current system time.
    ActivityBuilder& startTimestampNow();
    ActivityBuilder& startTimestamp(uint64_t epochSeconds);
    ActivityBuilder& endTimestamp(uint64_t epochSeconds);

    ActivityBuilder& largeImage(std::string key);
    ActivityBuilder& largeText(std::string text);
    ActivityBuilder& smallImage(std::string key);
    ActivityBuilder& smallText(std::string text);

    ActivityBuilder& party(std::string id, uint32_t currentSize, uint32_t maxSize);

    /// Appends a button. More than two makes the activity invalid.
    ActivityBuilder& button(std::string label, std::string url);

    ActivityBuilder& joinSecret(std::string secret);
    ActivityBuilder& spectateSecret(std::string secret);
    ActivityBuilder& matchSecret(std::string secret);

    ActivityBuilder& instance(bool value);

    Activity build() const { return activity_; }

private:
    ActivityTimestamps& timestamps();
    ActivityAssets& assets();
    ActivitySecrets& secrets();

    Activity activity_;
};

} // namespace activity
} // namespace presencelink
