#include "trade_store/data/database_pooling.hpp"

namespace trade_store {

Result<void> DatabasePool::initialize(StoreFactory factory, size_t pool_size,
                                      size_t max_pool_size) {
    ComponentScope scope("DatabasePool");
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        WARN("Database pool already initialized");
        return Result<void>();
    }
    if (!factory) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Store factory is empty",
                                "DatabasePool");
    }
    if (pool_size == 0 || pool_size > max_pool_size) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Pool size must be between 1 and " + std::to_string(max_pool_size),
                                "DatabasePool");
    }

    factory_ = std::move(factory);
    max_pool_size_ = max_pool_size;

    for (size_t i = 0; i < pool_size; ++i) {
        auto store = create_new_connection();
        if (store) {
            available_connections_.push_back(store);
        }
    }

    if (available_connections_.empty()) {
        factory_ = nullptr;
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "No connection in the pool could be opened", "DatabasePool");
    }

    initialized_ = true;
    INFO("Database pool initialized with " << available_connections_.size() << " of "
                                           << pool_size << " connections");

    return Result<void>();
}

void DatabasePool::shutdown() {
    ComponentScope scope("DatabasePool");
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& store : available_connections_) {
        store->disconnect();
    }
    available_connections_.clear();
    total_connections_ = 0;
    factory_ = nullptr;
    if (initialized_) {
        initialized_ = false;
        INFO("Database pool shut down");
    }
    cv_.notify_all();
}

std::shared_ptr<TradingStore> DatabasePool::create_new_connection() {
    auto store = factory_();
    if (!store) {
        ERROR("Store factory returned no store");
        return nullptr;
    }

    auto result = store->connect();
    if (result.is_ok()) {
        total_connections_++;
        DEBUG("Created new store connection. Total connections: " << total_connections_);
        return store;
    }

    ERROR("Failed to create new connection: " << result.error()->to_string());
    return nullptr;
}

DatabasePool::ConnectionGuard DatabasePool::acquire_connection(int max_retries,
                                                               std::chrono::milliseconds timeout) {
    ComponentScope scope("DatabasePool");
    std::unique_lock<std::mutex> lock(mutex_);

    if (!initialized_) {
        ERROR("Connection requested from an uninitialized pool");
        return ConnectionGuard(nullptr, this);
    }

    int attempts = 0;
    while (available_connections_.empty() && attempts < max_retries) {
        // Wait for a connection to become available or timeout
        auto wait_result = cv_.wait_for(lock, timeout);
        if (!initialized_) {
            return ConnectionGuard(nullptr, this);
        }

        if (wait_result == std::cv_status::timeout) {
            attempts++;
            WARN("Timeout waiting for store connection (attempt " << attempts << "/"
                                                                  << max_retries << ")");

            // Expand the pool once the retries are used up
            if (attempts == max_retries && total_connections_ < max_pool_size_) {
                INFO("Creating emergency connection to expand pool");
                auto store = create_new_connection();
                if (store) {
                    return ConnectionGuard(store, this);
                }
            }
        }
    }

    if (available_connections_.empty()) {
        ERROR("No store connections available after retries");
        return ConnectionGuard(nullptr, this);
    }

    auto connection = available_connections_.front();
    available_connections_.pop_front();

    // Ensure the connection is still valid
    if (!connection->is_connected()) {
        INFO("Reconnecting stale store connection");
        auto reconnect_result = connection->connect();
        if (reconnect_result.is_error()) {
            ERROR("Failed to reconnect store: " << reconnect_result.error()->to_string());
            total_connections_--;
            connection = create_new_connection();
        }
    }

    return ConnectionGuard(connection, this);
}

Result<void> DatabasePool::return_connection(std::shared_ptr<TradingStore> connection) {
    ComponentScope scope("DatabasePool");
    if (!connection) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Null connection returned to pool",
                                "DatabasePool");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        // Pool was shut down while the store was handed out
        connection->disconnect();
        return Result<void>();
    }

    // Verify connection still works before returning to pool
    if (!connection->is_connected()) {
        INFO("Reconnecting failed connection before returning to pool");
        auto result = connection->connect();
        if (result.is_error()) {
            ERROR("Failed to reconnect returned connection: " << result.error()->to_string());
            // Don't return a bad connection to the pool
            total_connections_--;
            return Result<void>();
        }
    }

    available_connections_.push_back(connection);

    // Notify waiting threads
    cv_.notify_one();

    return Result<void>();
}

}  // namespace trade_store
