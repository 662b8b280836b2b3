#pragma once

/// @file match_repository.hpp
/// @brief Match storage interface and in-memory implementation.
///
/// Abstracts match storage so the forecast workflow can run against any
/// backend (in-memory, SQL database via EngineDatabase, etc.).

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "sfe/foundation/engine_result.hpp"
#include "sfe/model/match_types.hpp"

namespace sfe::service {

/// Filter applied uniformly to completed and pending listings.
struct MatchQuery {
    std::optional<std::string> competition;
    std::optional<int> season;
    /// Maximum number of records returned, after ordering.
    std::optional<std::size_t> limit;

    [[nodiscard]] bool matches(const model::MatchRecord& record) const;
};

/// Check a record before it is stored.
///
/// Rejects empty team names, a team playing itself, negative goals and
/// records with exactly one goal count present.
[[nodiscard]] foundation::EngineResult<void> validateMatchRecord(
    const model::MatchRecord& record);

/// Abstract interface for match persistence.
///
/// Implementations must be thread-safe when shared across threads.
class IMatchRepository {
public:
    virtual ~IMatchRepository() = default;

    /// Validate and store a match.
    [[nodiscard]] virtual foundation::EngineResult<void> addMatch(
        const model::MatchRecord& record) = 0;

    /// Completed matches (both goals present), ascending by date.
    [[nodiscard]] virtual foundation::EngineResult<model::MatchList> listCompleted(
        const MatchQuery& query) const = 0;

    /// Pending fixtures (both goals absent), ascending by date.
    [[nodiscard]] virtual foundation::EngineResult<model::MatchList> listPending(
        const MatchQuery& query) const = 0;

    /// Total stored records, completed and pending.
    [[nodiscard]] virtual foundation::EngineResult<std::size_t> count() const = 0;
};

/// Thread-safe in-memory match repository for tests and embedding.
///
/// Records with the same date keep insertion order.
class InMemoryMatchRepository : public IMatchRepository {
public:
    [[nodiscard]] foundation::EngineResult<void> addMatch(
        const model::MatchRecord& record) override;

    [[nodiscard]] foundation::EngineResult<model::MatchList> listCompleted(
        const MatchQuery& query) const override;

    [[nodiscard]] foundation::EngineResult<model::MatchList> listPending(
        const MatchQuery& query) const override;

    [[nodiscard]] foundation::EngineResult<std::size_t> count() const override;

private:
    model::MatchList select(const MatchQuery& query, bool completed) const;

    mutable std::mutex mutex_;
    model::MatchList records_;
};

}  // namespace sfe::service
