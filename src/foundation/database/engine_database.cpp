/// @file engine_database.cpp
/// @brief EngineDatabase and PreparedStatement over kcenon database_system.

#include "sfe/foundation/engine_database.hpp"

#include <database_manager.h>
#include <core/database_context.h>
#include <database_types.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <type_traits>
#include <utility>

namespace sfe::foundation {

namespace {

::database::database_types backendFor(DatabaseType type) {
    switch (type) {
        case DatabaseType::SQLite:     return ::database::database_types::sqlite;
        case DatabaseType::PostgreSQL: return ::database::database_types::postgres;
        case DatabaseType::MySQL:      return ::database::database_types::mysql;
    }
    return ::database::database_types::sqlite;
}

bool isPlaceholderChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_';
}

void appendQuoted(std::string& out, const std::string& text) {
    out += '\'';
    for (char c : text) {
        if (c == '\'') {
            out += '\'';
        }
        out += c;
    }
    out += '\'';
}

QueryResult toRows(const ::database::core::database_result& result) {
    QueryResult rows;
    rows.reserve(result.size());
    for (const auto& source : result) {
        DbRow row;
        for (const auto& [column, cell] : source) {
            row[column] = std::visit([](auto&& v) -> DbValue {
                using V = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<V, std::string> ||
                              std::is_same_v<V, std::int64_t> ||
                              std::is_same_v<V, double> ||
                              std::is_same_v<V, bool>) {
                    return v;
                } else {
                    return DbNull{};
                }
            }, cell);
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace

std::optional<DatabaseType> parseDatabaseType(std::string_view name) {
    if (name == "sqlite") {
        return DatabaseType::SQLite;
    }
    if (name == "postgresql" || name == "postgres") {
        return DatabaseType::PostgreSQL;
    }
    if (name == "mysql") {
        return DatabaseType::MySQL;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// PreparedStatement
// ---------------------------------------------------------------------------

PreparedStatement::PreparedStatement(std::string sql) : sql_(std::move(sql)) {}

PreparedStatement& PreparedStatement::bindString(std::string_view name, std::string value) {
    bindings_.insert_or_assign(std::string(name), Bound(std::move(value)));
    return *this;
}

PreparedStatement& PreparedStatement::bindInt(std::string_view name, std::int64_t value) {
    bindings_.insert_or_assign(std::string(name), Bound(value));
    return *this;
}

PreparedStatement& PreparedStatement::bindOptionalInt(std::string_view name,
                                                      std::optional<std::int64_t> value) {
    bindings_.insert_or_assign(std::string(name), value ? Bound(*value) : Bound(DbNull{}));
    return *this;
}

std::string PreparedStatement::resolve() const {
    std::string out;
    out.reserve(sql_.size() + 16 * bindings_.size());

    std::size_t pos = 0;
    while (pos < sql_.size()) {
        const auto dollar = sql_.find('$', pos);
        if (dollar == std::string::npos) {
            out.append(sql_, pos, std::string::npos);
            break;
        }
        out.append(sql_, pos, dollar - pos);

        auto end = dollar + 1;
        while (end < sql_.size() && isPlaceholderChar(sql_[end])) {
            ++end;
        }
        const std::string_view name(sql_.data() + dollar + 1, end - dollar - 1);

        auto it = name.empty() ? bindings_.end() : bindings_.find(name);
        if (it == bindings_.end()) {
            out.append(sql_, dollar, end - dollar);
        } else if (const auto* text = std::get_if<std::string>(&it->second)) {
            appendQuoted(out, *text);
        } else if (const auto* number = std::get_if<std::int64_t>(&it->second)) {
            out += std::to_string(*number);
        } else {
            out += "NULL";
        }
        pos = end;
    }
    return out;
}

// ---------------------------------------------------------------------------
// Pool
// ---------------------------------------------------------------------------

struct EngineDatabase::Impl {
    struct Slot {
        std::shared_ptr<::database::database_context> context;
        std::unique_ptr<::database::database_manager> manager;
        bool busy = false;
    };

    /// Holds one slot for the duration of a call.
    class Lease {
    public:
        Lease(Impl& owner, Slot& slot) : owner_(&owner), slot_(&slot) {}
        Lease(Lease&& other) noexcept
            : owner_(std::exchange(other.owner_, nullptr)), slot_(other.slot_) {}
        Lease& operator=(Lease&&) = delete;
        ~Lease() {
            if (owner_) {
                owner_->release(*slot_);
            }
        }

        ::database::database_manager& operator*() const { return *slot_->manager; }
        ::database::database_manager* operator->() const { return slot_->manager.get(); }

    private:
        Impl* owner_;
        Slot* slot_;
    };

    DatabaseConfig config;
    std::vector<std::unique_ptr<Slot>> slots;
    std::mutex mutex;
    std::condition_variable released;
    std::atomic<bool> connected{false};

    std::unique_ptr<Slot> open() const {
        auto slot = std::make_unique<Slot>();
        slot->context = std::make_shared<::database::database_context>();
        slot->manager = std::make_unique<::database::database_manager>(slot->context);
        if (!slot->manager->set_mode(backendFor(config.dbType))) {
            return nullptr;
        }
        if (!slot->manager->connect_result(config.connectionString).is_ok()) {
            return nullptr;
        }
        return slot;
    }

    EngineResult<Lease> acquire() {
        if (!connected.load()) {
            return EngineResult<Lease>::err(
                EngineError(ErrorCode::NotConnected, "database is not connected"));
        }

        std::unique_lock lock(mutex);
        const auto deadline = std::chrono::steady_clock::now() + config.connectionTimeout;
        for (;;) {
            for (auto& slot : slots) {
                if (!slot->busy) {
                    slot->busy = true;
                    return EngineResult<Lease>::ok(Lease(*this, *slot));
                }
            }
            if (slots.size() < config.maxConnections) {
                if (auto slot = open()) {
                    slot->busy = true;
                    slots.push_back(std::move(slot));
                    return EngineResult<Lease>::ok(Lease(*this, *slots.back()));
                }
            }
            if (released.wait_until(lock, deadline) == std::cv_status::timeout) {
                return EngineResult<Lease>::err(EngineError(
                    ErrorCode::ConnectionPoolExhausted,
                    "no connection freed within " +
                        std::to_string(config.connectionTimeout.count()) + "s"));
            }
        }
    }

    void release(Slot& slot) {
        {
            std::lock_guard lock(mutex);
            slot.busy = false;
        }
        released.notify_one();
    }
};

EngineDatabase::EngineDatabase() : impl_(std::make_unique<Impl>()) {}

EngineDatabase::~EngineDatabase() {
    disconnect();
}

EngineResult<void> EngineDatabase::connect(const DatabaseConfig& config) {
    if (config.maxConnections == 0 || config.minConnections > config.maxConnections) {
        return EngineResult<void>::err(EngineError(
            ErrorCode::InvalidArgument, "connection pool bounds must satisfy 0 < min <= max"));
    }
    if (impl_->connected.load()) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::AlreadyExists, "database is already connected"));
    }

    impl_->config = config;
    std::lock_guard lock(impl_->mutex);
    for (uint32_t opened = 0; opened < config.minConnections; ++opened) {
        auto slot = impl_->open();
        if (!slot) {
            impl_->slots.clear();
            return EngineResult<void>::err(EngineError(
                ErrorCode::DatabaseError,
                "cannot open " + config.connectionString + " (connection " +
                    std::to_string(opened + 1) + " of " +
                    std::to_string(config.minConnections) + ")"));
        }
        impl_->slots.push_back(std::move(slot));
    }
    impl_->connected.store(true);
    return EngineResult<void>::ok();
}

void EngineDatabase::disconnect() {
    if (!impl_->connected.exchange(false)) {
        return;
    }
    std::lock_guard lock(impl_->mutex);
    for (auto& slot : impl_->slots) {
        (void)slot->manager->disconnect_result();
    }
    impl_->slots.clear();
}

bool EngineDatabase::isConnected() const noexcept {
    return impl_->connected.load();
}

EngineResult<QueryResult> EngineDatabase::query(std::string_view sql) {
    auto lease = impl_->acquire();
    if (!lease) {
        return EngineResult<QueryResult>::err(lease.error());
    }
    auto result = lease.value()->select_query_result(std::string(sql));
    if (!result.is_ok()) {
        return EngineResult<QueryResult>::err(
            EngineError(ErrorCode::QueryFailed, result.error().message));
    }
    return EngineResult<QueryResult>::ok(toRows(result.value()));
}

EngineResult<void> EngineDatabase::execute(std::string_view sql) {
    auto lease = impl_->acquire();
    if (!lease) {
        return EngineResult<void>::err(lease.error());
    }
    auto result = lease.value()->execute_query_result(std::string(sql));
    if (!result.is_ok()) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::QueryFailed, result.error().message));
    }
    return EngineResult<void>::ok();
}

EngineResult<QueryResult> EngineDatabase::execute(const PreparedStatement& stmt) {
    return query(stmt.resolve());
}

} // namespace sfe::foundation
