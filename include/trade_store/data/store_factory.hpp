// include/trade_store/data/store_factory.hpp

#pragma once

#include <memory>
#include "trade_store/core/error.hpp"
#include "trade_store/data/database_pooling.hpp"
#include "trade_store/data/store_config.hpp"
#include "trade_store/data/store_interface.hpp"

namespace trade_store {

/**
 * @brief Build the configured engine without connecting it
 */
Result<std::shared_ptr<TradingStore>> create_store(const StoreConfig& config);

/**
 * @brief Factory for DatabasePool::initialize
 *
 * With the memory backend every pooled store has its own independent state.
 */
DatabasePool::StoreFactory make_store_factory(const StoreConfig& config);

/**
 * @brief Create and connect the configured engine
 *
 * For the memory backend an existing snapshot_path is loaded after connecting.
 */
Result<std::shared_ptr<TradingStore>> open_store(const StoreConfig& config);

/**
 * @brief Write a memory store back to its snapshot_path
 *
 * A no-op for the postgres backend or when no snapshot_path is configured.
 */
Result<void> persist_store(TradingStore& store, const StoreConfig& config);

}  // namespace trade_store
