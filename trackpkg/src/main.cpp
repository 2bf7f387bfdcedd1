#include <iostream>
#include <vector>
#include "types.hpp"
#include "classifier.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

int main() {
    // 1. Read Input (Stdin)
    json input;
    try {
        std::cin >> input;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing JSON input: " << e.what() << std::endl;
        return 1;
    }

    // 2. Extract Tracking Numbers and Options
    TrackingRequest request;
    try {
        request = input.get<TrackingRequest>();
    } catch (const std::exception& e) {
        std::cerr << "Error extracting data from JSON: " << e.what() << std::endl;

        // Output Error JSON
        json error_output = {
            {"status", "error"},
            {"message", e.what()}
        };
        std::cout << error_output.dump(4) << std::endl;
        return 1;
    }

    // 3. Classify
    std::vector<TrackingResult> results = Classifier::classify_all(request);

    // 4. Output Results (Stdout)
    json output_results = results;
    std::cout << output_results.dump(4) << std::endl;

    return 0;
}
