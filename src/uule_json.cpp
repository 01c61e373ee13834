#include "uule/uule_json.hpp"

namespace uule {

using json = nlohmann::json;

void to_json(json& j, const Uulev1Data& data) {
    j = json{
        {"role", data.role},
        {"producer", data.producer},
        {"canonical_name", data.canonical_name}
    };
}

void from_json(const json& j, Uulev1Data& data) {
    j.at("role").get_to(data.role);
    j.at("producer").get_to(data.producer);
    j.at("canonical_name").get_to(data.canonical_name);
}

void to_json(json& j, const Uulev2Data& data) {
    j = json{
        {"role", data.role},
        {"producer", data.producer},
        {"provenance", data.provenance},
        {"timestamp", data.timestamp},
        {"lat", data.lat},
        {"lng", data.lng},
        {"radius", data.radius}
    };
}

// Missing keys throw json::out_of_range, wrong types json::type_error
void from_json(const json& j, Uulev2Data& data) {
    j.at("role").get_to(data.role);
    j.at("producer").get_to(data.producer);
    j.at("provenance").get_to(data.provenance);
    j.at("timestamp").get_to(data.timestamp);
    j.at("lat").get_to(data.lat);
    j.at("lng").get_to(data.lng);
    j.at("radius").get_to(data.radius);
}

} // namespace uule
