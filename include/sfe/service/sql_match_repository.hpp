#pragma once

/// @file sql_match_repository.hpp
/// @brief IMatchRepository backed by an EngineDatabase `matches` table.
///
/// Table layout:
/// | Column      | Type    | Notes                        |
/// |-------------|---------|------------------------------|
/// | id          | integer | auto-increment, insert order |
/// | date        | text    | ISO-8601 date                |
/// | competition | text    |                              |
/// | season      | integer | season start year            |
/// | home_team   | text    |                              |
/// | away_team   | text    |                              |
/// | home_goals  | integer | NULL while pending           |
/// | away_goals  | integer | NULL while pending           |

#include <string>

#include "sfe/foundation/engine_database.hpp"
#include "sfe/service/match_repository.hpp"

namespace sfe::service {

class SqlMatchRepository : public IMatchRepository {
public:
    /// @param db     Connected database; must outlive the repository.
    /// @param dbType Dialect used for the schema's auto-increment column.
    explicit SqlMatchRepository(foundation::EngineDatabase& db,
                                foundation::DatabaseType dbType = foundation::DatabaseType::SQLite);

    /// Create the matches table and its lookup index if missing.
    [[nodiscard]] foundation::EngineResult<void> initialize();

    [[nodiscard]] foundation::EngineResult<void> addMatch(
        const model::MatchRecord& record) override;

    [[nodiscard]] foundation::EngineResult<model::MatchList> listCompleted(
        const MatchQuery& query) const override;

    [[nodiscard]] foundation::EngineResult<model::MatchList> listPending(
        const MatchQuery& query) const override;

    [[nodiscard]] foundation::EngineResult<std::size_t> count() const override;

    // ── Statement builders (exposed for tests) ──────────────────────────

    [[nodiscard]] static std::string createTableSql(foundation::DatabaseType dbType);

    [[nodiscard]] static foundation::PreparedStatement insertStatement(
        const model::MatchRecord& record);

    /// SELECT over completed (both goals set) or pending (both NULL) rows,
    /// filtered by @p query and ordered by date then insertion order.
    [[nodiscard]] static foundation::PreparedStatement selectStatement(
        const MatchQuery& query, bool completed);

    /// Convert one result row into a MatchRecord.
    /// Missing or NULL goal columns become absent goal counts.
    [[nodiscard]] static foundation::EngineResult<model::MatchRecord> rowToMatch(
        const foundation::DbRow& row);

private:
    foundation::EngineResult<model::MatchList> select(const MatchQuery& query,
                                                      bool completed) const;

    foundation::EngineDatabase& db_;
    foundation::DatabaseType dbType_;
};

}  // namespace sfe::service
