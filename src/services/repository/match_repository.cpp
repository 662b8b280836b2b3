/// @file match_repository.cpp
/// @brief MatchQuery, record validation and InMemoryMatchRepository.

#include "sfe/service/match_repository.hpp"

#include <algorithm>

namespace sfe::service {

using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;
using model::MatchList;
using model::MatchRecord;

bool MatchQuery::matches(const MatchRecord& record) const {
    if (competition && record.competition != *competition) {
        return false;
    }
    if (season && record.season != *season) {
        return false;
    }
    return true;
}

EngineResult<void> validateMatchRecord(const MatchRecord& record) {
    auto reject = [](std::string message) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::InvalidMatchRecord, std::move(message)));
    };

    if (record.homeTeam.empty() || record.awayTeam.empty()) {
        return reject("match on " + record.date + " is missing a team name");
    }
    if (record.homeTeam == record.awayTeam) {
        return reject("team '" + record.homeTeam + "' cannot play itself");
    }
    if (record.homeGoals.has_value() != record.awayGoals.has_value()) {
        return reject(record.homeTeam + " vs " + record.awayTeam +
                      " has only one goal count");
    }
    if ((record.homeGoals && *record.homeGoals < 0) ||
        (record.awayGoals && *record.awayGoals < 0)) {
        return reject(record.homeTeam + " vs " + record.awayTeam +
                      " has a negative goal count");
    }
    return EngineResult<void>::ok();
}

EngineResult<void> InMemoryMatchRepository::addMatch(const MatchRecord& record) {
    auto valid = validateMatchRecord(record);
    if (!valid) {
        return valid;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
    return EngineResult<void>::ok();
}

EngineResult<MatchList> InMemoryMatchRepository::listCompleted(const MatchQuery& query) const {
    return EngineResult<MatchList>::ok(select(query, true));
}

EngineResult<MatchList> InMemoryMatchRepository::listPending(const MatchQuery& query) const {
    return EngineResult<MatchList>::ok(select(query, false));
}

EngineResult<std::size_t> InMemoryMatchRepository::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return EngineResult<std::size_t>::ok(records_.size());
}

MatchList InMemoryMatchRepository::select(const MatchQuery& query, bool completed) const {
    MatchList out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& record : records_) {
            bool wanted = completed ? record.isCompleted() : record.isPending();
            if (wanted && query.matches(record)) {
                out.push_back(record);
            }
        }
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const MatchRecord& lhs, const MatchRecord& rhs) {
                         return lhs.date < rhs.date;
                     });
    if (query.limit && out.size() > *query.limit) {
        out.resize(*query.limit);
    }
    return out;
}

}  // namespace sfe::service
