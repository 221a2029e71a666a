// src/schema/records.cpp

#include "trade_store/schema/records.hpp"
#include <stdexcept>
#include "trade_store/core/time_utils.hpp"

namespace trade_store {

namespace {

using nlohmann::json;

json timestamp_to_json(const Timestamp& ts) {
    return core::format_timestamp(ts);
}

Timestamp timestamp_from_json(const json& j, const char* column) {
    if (!j.contains(column) || j.at(column).is_null()) {
        throw std::invalid_argument(std::string("missing required column '") + column + "'");
    }
    auto parsed = core::parse_timestamp(j.at(column).get<std::string>());
    if (parsed.is_error()) {
        throw std::invalid_argument(std::string("column '") + column + "': " +
                                    parsed.error()->what());
    }
    return parsed.value();
}

template <typename T>
json optional_to_json(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

json optional_timestamp_to_json(const std::optional<Timestamp>& value) {
    return value ? timestamp_to_json(*value) : json(nullptr);
}

template <typename T>
std::optional<T> optional_from_json(const json& j, const char* column) {
    if (!j.contains(column) || j.at(column).is_null()) {
        return std::nullopt;
    }
    return j.at(column).get<T>();
}

std::optional<Timestamp> optional_timestamp_from_json(const json& j, const char* column) {
    if (!j.contains(column) || j.at(column).is_null()) {
        return std::nullopt;
    }
    return timestamp_from_json(j, column);
}

}  // namespace

void to_json(json& j, const Account& account) {
    j = json{{"account_id", account.account_id},
             {"owner", account.owner},
             {"created_at", timestamp_to_json(account.created_at)},
             {"cash_balance", account.cash_balance},
             {"margin_requirement", account.margin_requirement},
             {"margin_used", account.margin_used},
             {"last_update", optional_timestamp_to_json(account.last_update)}};
}

void from_json(const json& j, Account& account) {
    account.account_id = j.at("account_id").get<AccountId>();
    account.owner = j.at("owner").get<std::string>();
    account.created_at = timestamp_from_json(j, "created_at");
    account.cash_balance = j.at("cash_balance").get<double>();
    account.margin_requirement = j.at("margin_requirement").get<double>();
    account.margin_used = j.at("margin_used").get<double>();
    account.last_update = optional_timestamp_from_json(j, "last_update");
}

void to_json(json& j, const Trade& trade) {
    j = json{{"trade_id", trade.trade_id},
             {"account_id", trade.account_id},
             {"symbol", trade.symbol},
             {"timestamp", timestamp_to_json(trade.timestamp)},
             {"side", trade.side},
             {"quantity", trade.quantity},
             {"price", trade.price},
             {"fee", trade.fee},
             {"realized_pl", trade.realized_pl},
             {"strategy_name", optional_to_json(trade.strategy_name)}};
}

void from_json(const json& j, Trade& trade) {
    trade.trade_id = j.at("trade_id").get<RowId>();
    trade.account_id = j.at("account_id").get<AccountId>();
    trade.symbol = j.at("symbol").get<std::string>();
    trade.timestamp = timestamp_from_json(j, "timestamp");
    trade.side = j.at("side").get<std::string>();
    trade.quantity = j.at("quantity").get<double>();
    trade.price = j.at("price").get<double>();
    trade.fee = optional_from_json<double>(j, "fee").value_or(0.0);
    trade.realized_pl = optional_from_json<double>(j, "realized_pl").value_or(0.0);
    trade.strategy_name = optional_from_json<std::string>(j, "strategy_name");
}

void to_json(json& j, const Position& position) {
    j = json{{"position_id", position.position_id},
             {"account_id", position.account_id},
             {"symbol", position.symbol},
             {"long_qty", position.long_qty},
             {"short_qty", position.short_qty},
             {"long_cost_basis", position.long_cost_basis},
             {"short_cost_basis", position.short_cost_basis},
             {"short_margin_used", position.short_margin_used},
             {"opened_at", timestamp_to_json(position.opened_at)},
             {"closed_at", optional_timestamp_to_json(position.closed_at)}};
}

void from_json(const json& j, Position& position) {
    position.position_id = j.at("position_id").get<RowId>();
    position.account_id = j.at("account_id").get<AccountId>();
    position.symbol = j.at("symbol").get<std::string>();
    position.long_qty = optional_from_json<double>(j, "long_qty").value_or(0.0);
    position.short_qty = optional_from_json<double>(j, "short_qty").value_or(0.0);
    position.long_cost_basis = optional_from_json<double>(j, "long_cost_basis").value_or(0.0);
    position.short_cost_basis = optional_from_json<double>(j, "short_cost_basis").value_or(0.0);
    position.short_margin_used =
        optional_from_json<double>(j, "short_margin_used").value_or(0.0);
    position.opened_at = timestamp_from_json(j, "opened_at");
    position.closed_at = optional_timestamp_from_json(j, "closed_at");
}

void to_json(json& j, const PriceDatum& datum) {
    j = json{{"id", datum.id},
             {"symbol", datum.symbol},
             {"interval", datum.interval},
             {"open_time", timestamp_to_json(datum.open_time)},
             {"open", datum.open},
             {"high", datum.high},
             {"low", datum.low},
             {"close", datum.close},
             {"volume", datum.volume},
             {"close_time", timestamp_to_json(datum.close_time)},
             {"quote_volume", optional_to_json(datum.quote_volume)},
             {"count", optional_to_json(datum.count)},
             {"taker_buy_volume", optional_to_json(datum.taker_buy_volume)},
             {"taker_buy_quote_volume", optional_to_json(datum.taker_buy_quote_volume)}};
}

void from_json(const json& j, PriceDatum& datum) {
    datum.id = j.at("id").get<RowId>();
    datum.symbol = j.at("symbol").get<std::string>();
    datum.interval = j.at("interval").get<std::string>();
    datum.open_time = timestamp_from_json(j, "open_time");
    datum.open = j.at("open").get<double>();
    datum.high = j.at("high").get<double>();
    datum.low = j.at("low").get<double>();
    datum.close = j.at("close").get<double>();
    datum.volume = j.at("volume").get<double>();
    datum.close_time = timestamp_from_json(j, "close_time");
    datum.quote_volume = optional_from_json<double>(j, "quote_volume");
    datum.count = optional_from_json<std::int64_t>(j, "count");
    datum.taker_buy_volume = optional_from_json<double>(j, "taker_buy_volume");
    datum.taker_buy_quote_volume = optional_from_json<double>(j, "taker_buy_quote_volume");
}

void to_json(json& j, const StrategySignal& signal) {
    j = json{{"signal_id", signal.signal_id},
             {"symbol", signal.symbol},
             {"interval", signal.interval},
             {"timestamp", timestamp_to_json(signal.timestamp)},
             {"strategy_name", signal.strategy_name},
             {"signal", signal.signal},
             {"confidence", optional_to_json(signal.confidence)},
             {"metrics", optional_to_json(signal.metrics)}};
}

void from_json(const json& j, StrategySignal& signal) {
    signal.signal_id = j.at("signal_id").get<RowId>();
    signal.symbol = j.at("symbol").get<std::string>();
    signal.interval = j.at("interval").get<std::string>();
    signal.timestamp = timestamp_from_json(j, "timestamp");
    signal.strategy_name = j.at("strategy_name").get<std::string>();
    signal.signal = j.at("signal").get<std::string>();
    signal.confidence = optional_from_json<double>(j, "confidence");
    signal.metrics = optional_from_json<std::string>(j, "metrics");
}

void to_json(json& j, const PortfolioHistoryRecord& record) {
    j = json{{"record_id", record.record_id},
             {"account_id", record.account_id},
             {"timestamp", timestamp_to_json(record.timestamp)},
             {"portfolio_value", record.portfolio_value},
             {"long_exposure", optional_to_json(record.long_exposure)},
             {"short_exposure", optional_to_json(record.short_exposure)},
             {"gross_exposure", optional_to_json(record.gross_exposure)},
             {"net_exposure", optional_to_json(record.net_exposure)},
             {"long_short_ratio", optional_to_json(record.long_short_ratio)}};
}

void from_json(const json& j, PortfolioHistoryRecord& record) {
    record.record_id = j.at("record_id").get<RowId>();
    record.account_id = j.at("account_id").get<AccountId>();
    record.timestamp = timestamp_from_json(j, "timestamp");
    record.portfolio_value = j.at("portfolio_value").get<double>();
    record.long_exposure = optional_from_json<double>(j, "long_exposure");
    record.short_exposure = optional_from_json<double>(j, "short_exposure");
    record.gross_exposure = optional_from_json<double>(j, "gross_exposure");
    record.net_exposure = optional_from_json<double>(j, "net_exposure");
    record.long_short_ratio = optional_from_json<double>(j, "long_short_ratio");
}

}  // namespace trade_store
