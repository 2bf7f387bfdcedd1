#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

enum class Carrier {
    UPS,
    FEDEX_EXPRESS,
    FEDEX_GROUND,
    USPS,
    NONE
};

// JSON conversions for Enums
NLOHMANN_JSON_SERIALIZE_ENUM(Carrier, {
    {Carrier::NONE, "NONE"},
    {Carrier::UPS, "UPS"},
    {Carrier::FEDEX_EXPRESS, "FEDEX_EXPRESS"},
    {Carrier::FEDEX_GROUND, "FEDEX_GROUND"},
    {Carrier::USPS, "USPS"}
})

// Add nlohmann::json serializer for std::optional
namespace nlohmann {
    template <typename T>
    struct adl_serializer<std::optional<T>> {
        static void to_json(json& j, const std::optional<T>& opt) {
            if (opt == std::nullopt) {
                j = nullptr;
            } else {
                j = *opt;
            }
        }

        static void from_json(const json& j, std::optional<T>& opt) {
            if (j.is_null()) {
                opt = std::nullopt;
            } else {
                opt = j.get<T>();
            }
        }
    };
}

// Lower case carrier name ("ups", "fedex", "usps"), empty for NONE.
// Both FedEx services share the "fedex" family.
inline std::string carrier_family(Carrier carrier) {
    switch (carrier) {
        case Carrier::UPS:
            return "ups";
        case Carrier::FEDEX_EXPRESS:
        case Carrier::FEDEX_GROUND:
            return "fedex";
        case Carrier::USPS:
            return "usps";
        case Carrier::NONE:
            break;
    }
    return "";
}

struct TrackingResult {
    std::string tracking_number;
    Carrier carrier;
    std::string family;
    std::optional<std::string> url;

    // Serialization
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TrackingResult, tracking_number, carrier, family, url)
};

struct TrackingRequest {
    std::vector<std::string> tracking_numbers;
    bool include_url = true;
};

// Accepts a bare array of numbers or {"tracking_numbers": [...], "include_url": bool}.
// Any other shape throws nlohmann::json::exception.
inline void from_json(const nlohmann::json& j, TrackingRequest& request) {
    if (j.is_array()) {
        j.get_to(request.tracking_numbers);
        return;
    }
    j.at("tracking_numbers").get_to(request.tracking_numbers);
    request.include_url = j.value("include_url", true);
}
