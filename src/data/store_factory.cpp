// src/data/store_factory.cpp

#include "trade_store/data/store_factory.hpp"
#include <filesystem>
#include "trade_store/data/memory_store.hpp"
#include "trade_store/data/postgres_store.hpp"

namespace trade_store {

Result<std::shared_ptr<TradingStore>> create_store(const StoreConfig& config) {
    auto validation = config.validate();
    if (validation.is_error()) {
        return forward_error<std::shared_ptr<TradingStore>>(validation);
    }

    switch (config.backend) {
        case StoreBackend::POSTGRES:
            return Result<std::shared_ptr<TradingStore>>(std::make_shared<PostgresStore>(
                resolve_connection_string(config.database)));
        case StoreBackend::MEMORY:
            return Result<std::shared_ptr<TradingStore>>(std::make_shared<MemoryStore>());
        default:
            return make_error<std::shared_ptr<TradingStore>>(
                ErrorCode::INVALID_ARGUMENT, "Unsupported store backend", "StoreFactory");
    }
}

DatabasePool::StoreFactory make_store_factory(const StoreConfig& config) {
    return [config]() -> std::shared_ptr<TradingStore> {
        auto store = create_store(config);
        if (store.is_error()) {
            ERROR("Cannot create store: " << store.error()->what());
            return nullptr;
        }
        return store.value();
    };
}

Result<std::shared_ptr<TradingStore>> open_store(const StoreConfig& config) {
    auto created = create_store(config);
    if (created.is_error()) {
        return created;
    }
    auto store = created.value();

    auto connected = store->connect();
    if (connected.is_error()) {
        return forward_error<std::shared_ptr<TradingStore>>(connected);
    }

    if (config.backend == StoreBackend::MEMORY && !config.snapshot_path.empty() &&
        std::filesystem::exists(config.snapshot_path)) {
        auto& memory = static_cast<MemoryStore&>(*store);
        auto loaded = memory.load_snapshot(config.snapshot_path);
        if (loaded.is_error()) {
            return forward_error<std::shared_ptr<TradingStore>>(loaded);
        }
    }

    return Result<std::shared_ptr<TradingStore>>(store);
}

Result<void> persist_store(TradingStore& store, const StoreConfig& config) {
    if (config.backend != StoreBackend::MEMORY || config.snapshot_path.empty()) {
        return Result<void>();
    }

    auto* memory = dynamic_cast<MemoryStore*>(&store);
    if (memory == nullptr) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Memory backend configured but store is not a MemoryStore",
                                "StoreFactory");
    }
    return memory->save_snapshot(config.snapshot_path);
}

}  // namespace trade_store
