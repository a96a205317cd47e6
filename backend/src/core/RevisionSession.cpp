#include "RevisionSession.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <unordered_set>
#include <spdlog/spdlog.h>

const char* toString(SessionStatus status) {
    switch (status) {
    case SessionStatus::CREATED: return "Created";
    case SessionStatus::IN_PROGRESS: return "InProgress";
    case SessionStatus::COMPLETED: return "Completed";
    case SessionStatus::ABANDONED: return "Abandoned";
    }
    return "Unknown";
}

RevisionSessionCoordinator::RevisionSessionCoordinator(const DueSetSelector& sel, const SchedulingEngine& eng)
    : selector(sel), engine(eng)
{
}

size_t RevisionSessionCoordinator::start(const std::vector<ScheduledItem>& candidatePool,
    std::time_t now, size_t sessionSize) {
    requireStatus(SessionStatus::CREATED, "start");

    auto due = selector.selectDue(candidatePool, now, sessionSize);
    for (const ScheduledItem* entry : due) {
        // Duplicate ids in the pool collapse to the first (most urgent) entry.
        if (snapshots.emplace(entry->item.id, *entry).second) {
            pending.push_back(entry->item.id);
        }
    }

    started_at = now;
    state = SessionStatus::IN_PROGRESS;

    if (pending.empty()) {
        spdlog::info("Session started with nothing due ({} candidates)", candidatePool.size());
    }
    else {
        spdlog::info("Session started: {} of {} candidates queued", pending.size(), candidatePool.size());
    }
    return pending.size();
}

SubmitResult RevisionSessionCoordinator::submitOutcome(const std::string& itemId,
    const RawSignal& signal, std::time_t now) {
    requireStatus(SessionStatus::IN_PROGRESS, "submitOutcome");

    auto pos = std::find(pending.begin(), pending.end(), itemId);
    if (pos == pending.end()) {
        throw UnknownItemError("item '" + itemId + "' is not in the session queue");
    }

    ScheduledItem& entry = snapshots.at(itemId);

    // Nothing below mutates the session until the engine has accepted the outcome.
    SubmitResult result;
    result.event = engine.review(itemId, entry.state, signal, now);

    pending.erase(pos);
    entry.state = result.event.resulting_state;
    recorded.push_back(result.event);

    if (engine.isPassing(result.event.quality)) {
        passed++;
    }
    else {
        int& count = redrills[itemId];
        int limit = engine.getConfig().max_session_redrills;
        if (limit == EngineConfig::UNLIMITED_REDRILLS || count < limit) {
            count++;
            pending.push_back(itemId);
            result.requeued = true;
            spdlog::debug("Item {} re-queued for drill #{}", itemId, count);
        }
        else {
            spdlog::warn("Item {} failed again; re-drill limit {} reached", itemId, limit);
        }
    }

    return result;
}

SessionStats RevisionSessionCoordinator::complete(std::time_t now) {
    requireStatus(SessionStatus::IN_PROGRESS, "complete");

    SessionStats stats = buildStats(now);
    state = SessionStatus::COMPLETED;

    spdlog::info("Session completed: {} items, {} answers, pass rate {:.0f}%, {} left unanswered",
        stats.items_reviewed, stats.submissions, stats.pass_rate * 100.0, stats.left_in_queue);
    return stats;
}

void RevisionSessionCoordinator::abandon() {
    if (state == SessionStatus::COMPLETED || state == SessionStatus::ABANDONED) {
        throw InvalidSessionStateError(std::string("cannot abandon a session that is ") + toString(state));
    }
    state = SessionStatus::ABANDONED;
    spdlog::info("Session abandoned with {} answers recorded, {} left", recorded.size(), pending.size());
}

std::optional<std::string> RevisionSessionCoordinator::nextItemId() const {
    if (pending.empty()) return std::nullopt;
    return pending.front();
}

const ScheduledItem& RevisionSessionCoordinator::itemFor(const std::string& itemId) const {
    auto it = snapshots.find(itemId);
    if (it == snapshots.end()) {
        throw UnknownItemError("item '" + itemId + "' is not part of this session");
    }
    return it->second;
}

void RevisionSessionCoordinator::requireStatus(SessionStatus expected, const char* op) const {
    if (state != expected) {
        throw InvalidSessionStateError(std::string(op) + " requires a " + toString(expected)
            + " session, but it is " + toString(state));
    }
}

SessionStats RevisionSessionCoordinator::buildStats(std::time_t now) const {
    SessionStats stats;
    std::unordered_set<std::string> distinct;
    for (const auto& ev : recorded) {
        distinct.insert(ev.item_id);
    }

    stats.items_reviewed = distinct.size();
    stats.submissions = recorded.size();
    stats.passed = passed;
    stats.pass_rate = recorded.empty() ? 0.0 : static_cast<double>(passed) / static_cast<double>(recorded.size());
    stats.elapsed_seconds = std::max<std::time_t>(0, now - started_at);
    stats.left_in_queue = pending.size();
    return stats;
}
