#include "trade_store/schema/signal_metrics.hpp"

namespace trade_store {

bool SignalMetrics::is_flat_scalar_map(const nlohmann::json& metrics) {
    if (!metrics.is_object()) {
        return false;
    }
    for (const auto& item : metrics.items()) {
        if (item.value().is_object() || item.value().is_array() || item.value().is_binary()) {
            return false;
        }
    }
    return true;
}

Result<std::string> SignalMetrics::encode(const nlohmann::json& metrics) {
    if (!is_flat_scalar_map(metrics)) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT,
                                       "Signal metrics must be an object of scalar values",
                                       "SignalMetrics");
    }
    return Result<std::string>(metrics.dump());
}

Result<nlohmann::json> SignalMetrics::decode(const std::string& text) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<nlohmann::json>(ErrorCode::JSON_PARSE_ERROR,
                                          "Signal metrics are not valid JSON: " +
                                              std::string(e.what()),
                                          "SignalMetrics");
    }

    if (!is_flat_scalar_map(parsed)) {
        return make_error<nlohmann::json>(ErrorCode::INVALID_DATA,
                                          "Signal metrics are not an object of scalar values",
                                          "SignalMetrics");
    }
    return Result<nlohmann::json>(std::move(parsed));
}

}  // namespace trade_store
