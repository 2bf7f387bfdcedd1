#include "classifier.hpp"
#include "validators.hpp"

namespace {

const char* const UPS_URL = "http://wwwapps.ups.com/tracking/tracking.cgi?tracknum=";
const char* const FEDEX_URL = "http://www.fedex.com/Tracking?tracknumbers=";
const char* const USPS_URL = "http://trkcnfrm1.smi.usps.com/PTSInternetWeb/InterLabelInquiry.do?strOrigTrackNum=";

} // namespace

Carrier Classifier::classify(const std::string& number) {
    if (Validators::ups(number)) {
        return Carrier::UPS;
    }
    if (Validators::fedex_express(number)) {
        return Carrier::FEDEX_EXPRESS;
    }
    if (Validators::fedex_ground(number)) {
        return Carrier::FEDEX_GROUND;
    }
    if (Validators::usps(number)) {
        return Carrier::USPS;
    }
    return Carrier::NONE;
}

std::optional<std::string> Classifier::tracking_url(const std::string& number) {
    return url_for(classify(number), number);
}

std::vector<TrackingResult> Classifier::classify_all(const TrackingRequest& request) {
    std::vector<TrackingResult> results;
    results.reserve(request.tracking_numbers.size());

    for (const auto& number : request.tracking_numbers) {
        Carrier carrier = classify(number);
        std::optional<std::string> url;
        if (request.include_url) {
            url = url_for(carrier, number);
        }
        results.push_back({number, carrier, carrier_family(carrier), url});
    }

    return results;
}

std::optional<std::string> Classifier::url_for(Carrier carrier, const std::string& number) {
    switch (carrier) {
        case Carrier::UPS:
            return UPS_URL + number;
        case Carrier::FEDEX_EXPRESS:
        case Carrier::FEDEX_GROUND:
            return FEDEX_URL + number;
        case Carrier::USPS:
            return USPS_URL + number;
        case Carrier::NONE:
            break;
    }
    return std::nullopt;
}
