#include "presencelink/activity/activity.hpp"

#include <initializer_list>

namespace presencelink {
namespace activity {

namespace {

using nlohmann::json;

IpcError invalid(const std::string& message) {
    return IpcError(ErrorCode::InvalidActivity, message);
}

Result<void> checkLength(const char* field, const std::optional<std::string>& value, size_t limit) {
    if (!value) {
        return Result<void>();
    }
    const size_t length = utf8Length(*value);
    if (length > limit) {
        return invalid(std::string(field) + " exceeds maximum length of " +
                       std::to_string(limit) + " characters (got " + std::to_string(length) + ")");
    }
    return Result<void>();
}

bool hasHttpScheme(const std::string& url) {
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

template <typename T>
void setIfPresent(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

template <typename T>
void readIfPresent(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->template get<T>();
    }
}

} // namespace

size_t utf8Length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

Result<void> Activity::validate() const {
    for (const auto& check : {
             checkLength("state", state_, MAX_TEXT_LENGTH),
             checkLength("details", details_, MAX_TEXT_LENGTH)}) {
        if (check.has_error()) {
            return check;
        }
    }

    if (assets_) {
        for (const auto& check : {
                 checkLength("large_image", assets_->largeImage, MAX_ASSET_KEY_LENGTH),
                 checkLength("large_text", assets_->largeText, MAX_TEXT_LENGTH),
                 checkLength("small_image", assets_->smallImage, MAX_ASSET_KEY_LENGTH),
                 checkLength("small_text", assets_->smallText, MAX_TEXT_LENGTH)}) {
            if (check.has_error()) {
                return check;
            }
        }
    }

    if (party_) {
        auto idCheck = checkLength("party id", party_->id, MAX_TEXT_LENGTH);
        if (idCheck.has_error()) {
            return idCheck;
        }
        if (party_->size && party_->size->current > party_->size->max) {
            return invalid("party size current (" + std::to_string(party_->size->current) +
                           ") exceeds max (" + std::to_string(party_->size->max) + ")");
        }
    }

    if (secrets_) {
        for (const auto& check : {
                 checkLength("join secret", secrets_->join, MAX_TEXT_LENGTH),
                 checkLength("spectate secret", secrets_->spectate, MAX_TEXT_LENGTH),
                 checkLength("match secret", secrets_->match, MAX_TEXT_LENGTH)}) {
            if (check.has_error()) {
                return check;
            }
        }
    }

    if (buttons_.size() > MAX_BUTTONS) {
        return invalid("at most " + std::to_string(MAX_BUTTONS) + " buttons allowed (got " +
                       std::to_string(buttons_.size()) + ")");
    }
    for (const auto& button : buttons_) {
        auto labelCheck = checkLength("button label", button.label, MAX_BUTTON_LABEL_LENGTH);
        if (labelCheck.has_error()) {
            return labelCheck;
        }
        auto urlCheck = checkLength("button url", button.url, MAX_BUTTON_URL_LENGTH);
        if (urlCheck.has_error()) {
            return urlCheck;
        }
        if (!hasHttpScheme(button.url)) {
            return invalid("button url must start with http:// or https:// (got '" + button.url + "')");
        }
    }

    return Result<void>();
}

void to_json(json& j, const Activity& activity) {
    j = json::object();
    setIfPresent(j, "state", activity.state_);
    setIfPresent(j, "details", activity.details_);

    if (activity.timestamps_) {
        json timestamps = json::object();
        setIfPresent(timestamps, "start", activity.timestamps_->start);
        setIfPresent(timestamps, "end", activity.timestamps_->end);
        j["timestamps"] = timestamps;
    }

    if (activity.assets_) {
        json assets = json::object();
        setIfPresent(assets, "large_image", activity.assets_->largeImage);
        setIfPresent(assets, "large_text", activity.assets_->largeText);
        setIfPresent(assets, "small_image", activity.assets_->smallImage);
        setIfPresent(assets, "small_text", activity.assets_->smallText);
        j["assets"] = assets;
    }

    if (activity.party_) {
        json party = json::object();
        setIfPresent(party, "id", activity.party_->id);
        if (activity.party_->size) {
            party["size"] = json::array({activity.party_->size->current, activity.party_->size->max});
        }
        j["party"] = party;
    }

    if (activity.secrets_) {
        json secrets = json::object();
        setIfPresent(secrets, "join", activity.secrets_->join);
        setIfPresent(secrets, "spectate", activity.secrets_->spectate);
        setIfPresent(secrets, "match", activity.secrets_->match);
        j["secrets"] = secrets;
    }

    if (!activity.buttons_.empty()) {
        json buttons = json::array();
        for (const auto& button : activity.buttons_) {
            buttons.push_back({{"label", button.label}, {"url", button.url}});
        }
        j["buttons"] = buttons;
    }

    setIfPresent(j, "instance", activity.instance_);
}

// Throws nlohmann::json::exception on mistyped fields, like any nlohmann from_json.
void from_json(const json& j, Activity& activity) {
    activity = Activity();
    readIfPresent(j, "state", activity.state_);
    readIfPresent(j, "details", activity.details_);

    if (auto it = j.find("timestamps"); it != j.end() && it->is_object()) {
        ActivityTimestamps timestamps;
        readIfPresent(*it, "start", timestamps.start);
        readIfPresent(*it, "end", timestamps.end);
        activity.timestamps_ = timestamps;
    }

    if (auto it = j.find("assets"); it != j.end() && it->is_object()) {
        ActivityAssets assets;
        readIfPresent(*it, "large_image", assets.largeImage);
        readIfPresent(*it, "large_text", assets.largeText);
        readIfPresent(*it, "small_image", assets.smallImage);
        readIfPresent(*it, "small_text", assets.smallText);
        activity.assets_ = assets;
    }

    if (auto it = j.find("party"); it != j.end() && it->is_object()) {
        ActivityParty party;
        readIfPresent(*it, "id", party.id);
        auto size = it->find("size");
        if (size != it->end() && size->is_array() && size->size() == 2) {
            party.size = PartySize{(*size)[0].get<uint32_t>(), (*size)[1].get<uint32_t>()};
        }
        activity.party_ = party;
    }

    if (auto it = j.find("secrets"); it != j.end() && it->is_object()) {
        ActivitySecrets secrets;
        readIfPresent(*it, "join", secrets.join);
        readIfPresent(*it, "spectate", secrets.spectate);
        readIfPresent(*it, "match", secrets.match);
        activity.secrets_ = secrets;
    }

    if (auto it = j.find("buttons"); it != j.end() && it->is_array()) {
        for (const auto& button : *it) {
            activity.buttons_.push_back(ActivityButton{button.at("label").get<std::string>(),
                                                       button.at("url").get<std::string>()});
        }
    }

    readIfPresent(j, "instance", activity.instance_);
}

} // namespace activity
} // namespace presencelink
