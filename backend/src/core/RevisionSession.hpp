#pragma once
#include <ctime>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "DueSetSelector.hpp"
#include "ReviewEvent.hpp"
#include "SchedulingEngine.hpp"

enum class SessionStatus {
    CREATED,
    IN_PROGRESS,
    COMPLETED,   // terminal
    ABANDONED    // terminal
};

const char* toString(SessionStatus status);

struct SessionStats {
    size_t items_reviewed = 0;   // distinct items answered at least once
    size_t submissions = 0;      // includes in-session re-drills
    size_t passed = 0;
    double pass_rate = 0.0;      // passed / submissions
    std::time_t elapsed_seconds = 0;
    size_t left_in_queue = 0;
};

struct SubmitResult {
    ReviewEvent event;
    bool requeued = false;
};

/*
  One bounded review session for a single learner.

  start() snapshots the due set as the session queue. Each submitted outcome
  is normalized and applied through the SchedulingEngine; the updated state is
  kept here for the caller to persist (see updatedItems()). A failing answer
  puts the item back at the end of this session's queue (unless a finite
  max_session_redrills has been configured and is used up). That re-drill
  lives only in the session and is separate from the persisted one-day
  interval. complete() may be called with items still queued.

  The selector and engine are copied in; both are small and immutable.

  Not thread-safe: submissions for a session must be serialized by its owner.
*/
class RevisionSessionCoordinator {
public:
    RevisionSessionCoordinator(const DueSetSelector& selector, const SchedulingEngine& engine);

    // Returns the number of queued items; 0 means nothing was due (not an error).
    size_t start(const std::vector<ScheduledItem>& candidatePool, std::time_t now, size_t sessionSize);

    SubmitResult submitOutcome(const std::string& itemId, const RawSignal& signal, std::time_t now);

    SessionStats complete(std::time_t now);
    void abandon();

    SessionStatus status() const { return state; }
    bool empty() const { return pending.empty(); }
    std::optional<std::string> nextItemId() const;
    const std::deque<std::string>& queue() const { return pending; }

    const ScheduledItem& itemFor(const std::string& itemId) const;
    const std::unordered_map<std::string, ScheduledItem>& updatedItems() const { return snapshots; }
    const std::vector<ReviewEvent>& events() const { return recorded; }

private:
    DueSetSelector selector;
    SchedulingEngine engine;

    SessionStatus state = SessionStatus::CREATED;
    std::time_t started_at = 0;

    std::deque<std::string> pending;
    std::unordered_map<std::string, ScheduledItem> snapshots;
    std::unordered_map<std::string, int> redrills;
    std::vector<ReviewEvent> recorded;
    size_t passed = 0;

    void requireStatus(SessionStatus expected, const char* op) const;
    SessionStats buildStats(std::time_t now) const;
};
