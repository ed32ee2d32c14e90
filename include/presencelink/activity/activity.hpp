#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "presencelink/utils/result.hpp"

namespace presencelink {
namespace activity {

/// Limits enforced by Activity::validate().
constexpr size_t MAX_TEXT_LENGTH = 128;
constexpr size_t MAX_ASSET_KEY_LENGTH = 256;
constexpr size_t MAX_BUTTONS = 2;
constexpr size_t MAX_BUTTON_LABEL_LENGTH = 32;
constexpr size_t MAX_BUTTON_URL_LENGTH = 512;

/**
 * @brief Start/end of the activity in unsigned Unix epoch seconds.
 */
struct ActivityTimestamps {
    std::optional<uint64_t> start;
    std::optional<uint64_t> end;
};

/**
 * @brief Image asset keys and their hover texts.
 */
struct ActivityAssets {
    std::optional<std::string> largeImage;
    std::optional<std::string> largeText;
    std::optional<std::string> smallImage;
    std::optional<std::string> smallText;
};

struct PartySize {
    uint32_t current = 0;
    uint32_t max = 0;
};

struct ActivityParty {
    std::optional<std::string> id;
    std::optional<PartySize> size;
};

struct ActivitySecrets {
    std::optional<std::string> join;
    std::optional<std::string> spectate;
    std::optional<std::string> match;
};

struct ActivityButton {
    std::string label;
    std::string url;
};

class ActivityBuilder;

/**
 * @brief Immutable presence payload.
 *
 * Built with ActivityBuilder. Unset fields are omitted from the JSON form.
 */
class Activity {
public:
    Activity() = default;

    const std::optional<std::string>& state() const { return state_; }
    const std::optional<std::string>& details() const { return details_; }
    const std::optional<ActivityTimestamps>& timestamps() const { return timestamps_; }
    const std::optional<ActivityAssets>& assets() const { return assets_; }
    const std::optional<ActivityParty>& party() const { return party_; }
    const std::optional<ActivitySecrets>& secrets() const { return secrets_; }
    const std::vector<ActivityButton>& buttons() const { return buttons_; }
    const std::optional<bool>& instance() const { return instance_; }

    /**
     * @brief Check field lengths, button count/URLs and party size.
     *
     * Lengths count Unicode code points. The first violation is reported as
     * InvalidActivity with a message naming the field and its limit, e.g.
     * "state exceeds maximum length of 128 characters (got 129)".
     */
    Result<void> validate() const;

    friend void to_json(nlohmann::json& j, const Activity& activity);
    friend void from_json(const nlohmann::json& j, Activity& activity);

private:
    friend class ActivityBuilder;

    std::optional<std::string> state_;
    std::optional<std::string> details_;
    std::optional<ActivityTimestamps> timestamps_;
    std::optional<ActivityAssets> assets_;
    std::optional<ActivityParty> party_;
    std::optional<ActivitySecrets> secrets_;
    std::vector<ActivityButton> buttons_;
    std::optional<bool> instance_;
};

/// Number of Unicode code points in a UTF-8 string.
size_t utf8Length(const std::string& text);

} // namespace activity
} // namespace presencelink
