#pragma once

/// @file engine_database.hpp
/// @brief EngineDatabase: pooled access to the match store through kcenon
///        database_system, plus the statement type used to build its SQL.

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "sfe/foundation/engine_result.hpp"

namespace sfe::foundation {

/// SQL NULL.
struct DbNull {};

/// One column value as read back from a backend.
using DbValue = std::variant<DbNull, std::string, std::int64_t, double, bool>;

/// Column name to value.
using DbRow = std::unordered_map<std::string, DbValue>;

using QueryResult = std::vector<DbRow>;

enum class DatabaseType : uint8_t {
    SQLite,
    PostgreSQL,
    MySQL
};

/// "sqlite", "postgresql", "postgres" or "mysql"; std::nullopt otherwise.
std::optional<DatabaseType> parseDatabaseType(std::string_view name);

/// For SQLite the connection string is the database file path.
struct DatabaseConfig {
    std::string connectionString = "matches.db";
    DatabaseType dbType = DatabaseType::SQLite;
    uint32_t minConnections = 1;
    uint32_t maxConnections = 4;
    std::chrono::seconds connectionTimeout{30};
};

/// SQL text with `$name` placeholders and the values bound to them.
///
/// resolve() renders text values as quoted literals (single quotes
/// doubled), integers as digits and empty optionals as NULL. Substitution
/// happens in one left-to-right pass over the template, so a bound value
/// that itself contains `$name` is emitted verbatim.
///
/// @code
///   PreparedStatement stmt("SELECT * FROM matches WHERE season = $season");
///   stmt.bindInt("season", 2023);
///   auto rows = db.execute(stmt);
/// @endcode
class PreparedStatement {
public:
    explicit PreparedStatement(std::string sql);

    PreparedStatement& bindString(std::string_view name, std::string value);
    PreparedStatement& bindInt(std::string_view name, std::int64_t value);
    PreparedStatement& bindOptionalInt(std::string_view name,
                                       std::optional<std::int64_t> value);

    [[nodiscard]] std::string_view sql() const noexcept { return sql_; }

    /// The template with every bound placeholder replaced.
    /// Placeholders with no binding are kept as written.
    [[nodiscard]] std::string resolve() const;

private:
    using Bound = std::variant<DbNull, std::string, std::int64_t>;

    std::string sql_;
    std::map<std::string, Bound, std::less<>> bindings_;
};

/// Connection pool over kcenon database_manager instances.
///
/// connect() opens DatabaseConfig::minConnections connections; further ones
/// are opened on demand up to maxConnections. A call that finds every
/// connection busy waits up to connectionTimeout and then fails with
/// ConnectionPoolExhausted.
class EngineDatabase {
public:
    EngineDatabase();
    ~EngineDatabase();

    EngineDatabase(const EngineDatabase&) = delete;
    EngineDatabase& operator=(const EngineDatabase&) = delete;

    /// @return InvalidArgument for bad pool bounds, AlreadyExists when
    ///         already connected, DatabaseError if a connection cannot open.
    [[nodiscard]] EngineResult<void> connect(const DatabaseConfig& config);

    void disconnect();

    [[nodiscard]] bool isConnected() const noexcept;

    [[nodiscard]] EngineResult<QueryResult> query(std::string_view sql);

    /// Run a statement that returns no rows (DDL, INSERT).
    [[nodiscard]] EngineResult<void> execute(std::string_view sql);

    /// Resolve @p stmt and run it as a query.
    [[nodiscard]] EngineResult<QueryResult> execute(const PreparedStatement& stmt);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sfe::foundation
