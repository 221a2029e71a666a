#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "trade_store/core/logger.hpp"
#include "trade_store/data/store_interface.hpp"

namespace trade_store {
namespace utils {

// Retry function with exponential backoff
template <typename Func>
auto retry_with_backoff(Func func, int max_retries = 3) -> decltype(func()) {
    int attempt = 0;
    std::chrono::milliseconds delay(100);  // Start with 100ms delay

    while (attempt < max_retries) {
        auto result = func();

        // Only engine and connection failures are worth another attempt
        if (!result.is_error() || (result.error()->code() != ErrorCode::DATABASE_ERROR &&
                                   result.error()->code() != ErrorCode::CONNECTION_ERROR)) {
            return result;
        }

        WARN("Store operation failed, retrying (attempt " << attempt + 1 << " of "
                                                          << max_retries
                                                          << "): " << result.error()->what());

        std::this_thread::sleep_for(delay);

        // Exponential backoff with jitter
        delay *= 2;
        delay += std::chrono::milliseconds(std::rand() % 100);

        attempt++;
    }

    // All retries failed, execute one last time and return the result
    return func();
}
}  // namespace utils

/**
 * @brief Pool of connected stores shared by worker threads
 */
class DatabasePool {
public:
    using StoreFactory = std::function<std::shared_ptr<TradingStore>()>;

    /**
     * @brief Get the singleton instance of the database pool
     * @return Reference to the database pool instance
     */
    static DatabasePool& instance() {
        static DatabasePool pool;
        return pool;
    }

    /**
     * @brief Initialize the pool with a set of connected stores
     * @param factory Creates one unconnected store per call
     * @param pool_size Number of stores to create up front
     * @param max_pool_size Upper bound including emergency connections
     * @return Result indicating success or failure
     */
    Result<void> initialize(StoreFactory factory, size_t pool_size = 5,
                            size_t max_pool_size = 20);

    /**
     * @brief Disconnect every pooled store and return to the uninitialized state
     *
     * Stores still held by guards are not touched; they are dropped when returned.
     */
    void shutdown();

    bool is_initialized() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return initialized_;
    }

    /**
     * @brief Connection guard class for managing connection lifecycle
     */
    class ConnectionGuard {
    public:
        /**
         * @brief Constructor
         * @param connection Shared pointer to the store
         * @param pool Pointer to the database pool
         */
        ConnectionGuard(std::shared_ptr<TradingStore> connection, DatabasePool* pool)
            : connection_(std::move(connection)), pool_(pool) {}

        /**
         * @brief Destructor
         */
        ~ConnectionGuard() {
            release();
        }

        /**
         * @brief Get the shared pointer to the store
         * @return Shared pointer to the store, null if acquisition failed
         */
        std::shared_ptr<TradingStore> get() const {
            return connection_;
        }

        explicit operator bool() const {
            return connection_ != nullptr;
        }

        // Disable copying
        ConnectionGuard(const ConnectionGuard&) = delete;
        ConnectionGuard& operator=(const ConnectionGuard&) = delete;

        // Allow moving
        ConnectionGuard(ConnectionGuard&& other) noexcept
            : connection_(std::move(other.connection_)), pool_(other.pool_) {
            other.pool_ = nullptr;
        }

        ConnectionGuard& operator=(ConnectionGuard&& other) noexcept {
            if (this != &other) {
                // Return our current connection if we have one
                release();

                // Take ownership of other's connection
                connection_ = std::move(other.connection_);
                pool_ = other.pool_;
                other.pool_ = nullptr;
            }
            return *this;
        }

        // Hand the store back before the guard goes out of scope
        void release() {
            if (connection_ && pool_) {
                auto returned = pool_->return_connection(connection_);
                if (returned.is_error()) {
                    WARN("Failed to return connection to pool: " << returned.error()->what());
                }
            }
            connection_.reset();
        }

    private:
        std::shared_ptr<TradingStore> connection_;
        DatabasePool* pool_;
    };

    /**
     * @brief Acquire a connection from the pool
     * @param max_retries Maximum number of waits for a returned connection
     * @param timeout Length of each wait
     * @return ConnectionGuard holding the store, empty if none could be acquired
     */
    ConnectionGuard acquire_connection(int max_retries = 3,
                                       std::chrono::milliseconds timeout = std::chrono::seconds(5));

    /**
     * @brief Return a connection to the pool
     * @param connection Shared pointer to the store
     * @return Result indicating success or failure
     */
    Result<void> return_connection(std::shared_ptr<TradingStore> connection);

    size_t available_connections_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return available_connections_.size();
    }

    /**
     * @brief Stores owned by the pool, pooled or handed out
     */
    size_t total_connections() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_connections_;
    }

private:
    DatabasePool() : initialized_(false), total_connections_(0), max_pool_size_(20) {}
    ~DatabasePool() = default;

    bool initialized_;
    size_t total_connections_;
    size_t max_pool_size_;
    StoreFactory factory_;
    std::deque<std::shared_ptr<TradingStore>> available_connections_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    // Call with mutex_ held
    std::shared_ptr<TradingStore> create_new_connection();
};

}  // namespace trade_store
