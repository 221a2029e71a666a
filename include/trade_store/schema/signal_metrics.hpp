// include/trade_store/schema/signal_metrics.hpp

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "trade_store/core/error.hpp"

namespace trade_store {

/**
 * @brief Codec for the opaque strategy_signals.metrics payload
 *
 * The store keeps metrics as text and never looks inside. Producers that
 * want structure use a flat JSON object whose values are scalars
 * (string, number, boolean or null); nested objects and arrays are rejected
 * so that the payload stays a plain string-keyed map.
 */
class SignalMetrics {
public:
    /**
     * @brief Serialize a flat metrics map to compact JSON text
     * @param metrics JSON object of scalar values
     * @return Result with the text, INVALID_ARGUMENT for non-flat input
     */
    static Result<std::string> encode(const nlohmann::json& metrics);

    /**
     * @brief Parse metrics text back into a flat JSON object
     * @param text Stored metrics text
     * @return Result with the object, JSON_PARSE_ERROR or INVALID_DATA on bad input
     */
    static Result<nlohmann::json> decode(const std::string& text);

    /**
     * @brief Check that a JSON value is an object of scalars
     */
    static bool is_flat_scalar_map(const nlohmann::json& metrics);
};

}  // namespace trade_store
