/// @file sql_match_repository.cpp
/// @brief SqlMatchRepository implementation.

#include "sfe/service/sql_match_repository.hpp"

#include <array>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "sfe/foundation/engine_logger.hpp"

namespace sfe::service {

using foundation::DatabaseType;
using foundation::DbNull;
using foundation::DbRow;
using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::PreparedStatement;
using model::MatchList;
using model::MatchRecord;

namespace {

constexpr const char* kSelectColumns =
    "SELECT date, competition, season, home_team, away_team, home_goals, away_goals "
    "FROM matches WHERE ";

/// Read an integer column. Empty optional for NULL or a missing column;
/// error for any non-integral value.
EngineResult<std::optional<long long>> readInt(const DbRow& row, const std::string& column) {
    using Out = EngineResult<std::optional<long long>>;
    auto it = row.find(column);
    if (it == row.end()) {
        return Out::ok(std::nullopt);
    }

    std::optional<long long> value;
    bool valid = true;
    std::visit([&](auto&& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, DbNull>) {
            value = std::nullopt;
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            value = static_cast<long long>(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            // Some backends report INTEGER affinity columns as REAL.
            if (std::trunc(arg) == arg && std::fabs(arg) < 9.0e18) {
                value = static_cast<long long>(arg);
            } else {
                valid = false;
            }
        } else {
            valid = false;
        }
    }, it->second);

    if (!valid) {
        return Out::err(EngineError(ErrorCode::MalformedRow,
                                    "column '" + column + "' is not an integer"));
    }
    return Out::ok(value);
}

EngineResult<std::string> readText(const DbRow& row, const std::string& column) {
    auto it = row.find(column);
    if (it == row.end()) {
        return EngineResult<std::string>::err(
            EngineError(ErrorCode::MalformedRow, "missing column '" + column + "'"));
    }
    if (const auto* text = std::get_if<std::string>(&it->second)) {
        return EngineResult<std::string>::ok(*text);
    }
    return EngineResult<std::string>::err(
        EngineError(ErrorCode::MalformedRow, "column '" + column + "' is not text"));
}

/// A stored goal count: absent, or an integer in [0, INT_MAX].
EngineResult<std::optional<int>> readGoals(const DbRow& row, const std::string& column) {
    using Out = EngineResult<std::optional<int>>;
    auto value = readInt(row, column);
    if (!value) {
        return Out::err(value.error());
    }
    if (!value.value()) {
        return Out::ok(std::nullopt);
    }
    const long long goals = *value.value();
    if (goals < 0 || goals > std::numeric_limits<int>::max()) {
        return Out::err(EngineError(ErrorCode::MalformedRow,
                                    "column '" + column + "' holds an invalid goal count " +
                                    std::to_string(goals)));
    }
    return Out::ok(static_cast<int>(goals));
}

} // namespace

SqlMatchRepository::SqlMatchRepository(foundation::EngineDatabase& db, DatabaseType dbType)
    : db_(db), dbType_(dbType) {}

std::string SqlMatchRepository::createTableSql(DatabaseType dbType) {
    std::string idColumn;
    switch (dbType) {
        case DatabaseType::SQLite:
            idColumn = "id INTEGER PRIMARY KEY AUTOINCREMENT";
            break;
        case DatabaseType::PostgreSQL:
            idColumn = "id BIGSERIAL PRIMARY KEY";
            break;
        case DatabaseType::MySQL:
            idColumn = "id BIGINT AUTO_INCREMENT PRIMARY KEY";
            break;
    }
    return "CREATE TABLE IF NOT EXISTS matches (" + idColumn +
           ", date TEXT NOT NULL"
           ", competition TEXT NOT NULL"
           ", season INTEGER NOT NULL"
           ", home_team TEXT NOT NULL"
           ", away_team TEXT NOT NULL"
           ", home_goals INTEGER"
           ", away_goals INTEGER)";
}

EngineResult<void> SqlMatchRepository::initialize() {
    auto created = db_.execute(createTableSql(dbType_));
    if (!created) {
        SFE_LOG_ERROR(LogCategory::Repository,
                      "failed to create matches table: " +
                      std::string(created.error().message()));
        return created;
    }
    // MySQL has no IF NOT EXISTS for indexes; the table scan is acceptable there.
    if (dbType_ != DatabaseType::MySQL) {
        auto indexed = db_.execute(
            "CREATE INDEX IF NOT EXISTS idx_matches_comp_season_date "
            "ON matches (competition, season, date)");
        if (!indexed) {
            return indexed;
        }
    }
    SFE_LOG_INFO(LogCategory::Repository, "matches table ready");
    return EngineResult<void>::ok();
}

PreparedStatement SqlMatchRepository::insertStatement(const MatchRecord& record) {
    PreparedStatement stmt(
        "INSERT INTO matches (date, competition, season, home_team, away_team, "
        "home_goals, away_goals) VALUES ($date, $competition, $season, $home_team, "
        "$away_team, $home_goals, $away_goals)");
    stmt.bindString("date", record.date)
        .bindString("competition", record.competition)
        .bindInt("season", record.season)
        .bindString("home_team", record.homeTeam)
        .bindString("away_team", record.awayTeam);

    auto widen = [](const std::optional<int>& goals) -> std::optional<std::int64_t> {
        if (goals) {
            return static_cast<std::int64_t>(*goals);
        }
        return std::nullopt;
    };
    stmt.bindOptionalInt("home_goals", widen(record.homeGoals))
        .bindOptionalInt("away_goals", widen(record.awayGoals));
    return stmt;
}

PreparedStatement SqlMatchRepository::selectStatement(const MatchQuery& query, bool completed) {
    std::string sql = kSelectColumns;
    sql += completed ? "home_goals IS NOT NULL AND away_goals IS NOT NULL"
                     : "home_goals IS NULL AND away_goals IS NULL";
    if (query.competition) {
        sql += " AND competition = $competition";
    }
    if (query.season) {
        sql += " AND season = $season";
    }
    sql += " ORDER BY date ASC, id ASC";
    if (query.limit) {
        sql += " LIMIT $limit";
    }

    PreparedStatement stmt(std::move(sql));
    if (query.competition) {
        stmt.bindString("competition", *query.competition);
    }
    if (query.season) {
        stmt.bindInt("season", *query.season);
    }
    if (query.limit) {
        stmt.bindInt("limit", static_cast<std::int64_t>(*query.limit));
    }
    return stmt;
}

EngineResult<MatchRecord> SqlMatchRepository::rowToMatch(const DbRow& row) {
    using Out = EngineResult<MatchRecord>;

    MatchRecord record;
    const std::array<std::pair<const char*, std::string*>, 4> textColumns = {{
        {"date", &record.date},
        {"competition", &record.competition},
        {"home_team", &record.homeTeam},
        {"away_team", &record.awayTeam},
    }};
    for (const auto& [column, field] : textColumns) {
        auto text = readText(row, column);
        if (!text) {
            return Out::err(text.error());
        }
        *field = std::move(text).value();
    }

    auto season = readInt(row, "season");
    if (!season) {
        return Out::err(season.error());
    }
    if (!season.value()) {
        return Out::err(EngineError(ErrorCode::MalformedRow, "season is NULL"));
    }
    const long long seasonYear = *season.value();
    if (seasonYear < std::numeric_limits<int>::min() ||
        seasonYear > std::numeric_limits<int>::max()) {
        return Out::err(EngineError(ErrorCode::MalformedRow, "season out of range"));
    }
    record.season = static_cast<int>(seasonYear);

    auto homeGoals = readGoals(row, "home_goals");
    if (!homeGoals) {
        return Out::err(homeGoals.error());
    }
    auto awayGoals = readGoals(row, "away_goals");
    if (!awayGoals) {
        return Out::err(awayGoals.error());
    }
    record.homeGoals = homeGoals.value();
    record.awayGoals = awayGoals.value();
    return Out::ok(std::move(record));
}

EngineResult<void> SqlMatchRepository::addMatch(const MatchRecord& record) {
    auto valid = validateMatchRecord(record);
    if (!valid) {
        return valid;
    }
    return db_.execute(insertStatement(record).resolve());
}

EngineResult<MatchList> SqlMatchRepository::listCompleted(const MatchQuery& query) const {
    return select(query, true);
}

EngineResult<MatchList> SqlMatchRepository::listPending(const MatchQuery& query) const {
    return select(query, false);
}

EngineResult<std::size_t> SqlMatchRepository::count() const {
    auto rows = db_.query("SELECT COUNT(*) AS n FROM matches");
    if (!rows) {
        return EngineResult<std::size_t>::err(rows.error());
    }
    if (rows.value().empty()) {
        return EngineResult<std::size_t>::ok(0);
    }
    auto n = readInt(rows.value().front(), "n");
    if (!n) {
        return EngineResult<std::size_t>::err(n.error());
    }
    return EngineResult<std::size_t>::ok(
        static_cast<std::size_t>(n.value().value_or(0)));
}

EngineResult<MatchList> SqlMatchRepository::select(const MatchQuery& query,
                                                   bool completed) const {
    auto rows = db_.execute(selectStatement(query, completed));
    if (!rows) {
        SFE_LOG_ERROR(LogCategory::Repository,
                      std::string("match query failed: ") +
                      std::string(rows.error().message()));
        return EngineResult<MatchList>::err(rows.error());
    }

    MatchList out;
    out.reserve(rows.value().size());
    for (const auto& row : rows.value()) {
        auto record = rowToMatch(row);
        if (!record) {
            return EngineResult<MatchList>::err(record.error());
        }
        out.push_back(std::move(record).value());
    }
    return EngineResult<MatchList>::ok(std::move(out));
}

}  // namespace sfe::service
