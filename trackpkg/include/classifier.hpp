#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

class Classifier {
public:
    // Tries UPS, FedEx Express, FedEx Ground, then USPS; first match wins
    static Carrier classify(const std::string& number);

    // Carrier tracking page for a valid number. The number is inserted
    // as given, untrimmed and without URL encoding.
    static std::optional<std::string> tracking_url(const std::string& number);

    // Classify a batch, keeping input order
    static std::vector<TrackingResult> classify_all(const TrackingRequest& request);

private:
    static std::optional<std::string> url_for(Carrier carrier, const std::string& number);
};
