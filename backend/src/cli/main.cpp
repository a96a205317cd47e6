#include <iostream>
#include <vector>
#include <string>
#include <algorithm>
#include <limits>
#include <ctime>

#include "../utils/logging.hpp"
#include "../core/Errors.hpp"
#include "../core/EngineConfig.hpp"
#include "../core/SchedulingEngine.hpp"
#include "../core/DecayModel.hpp"
#include "../core/DueSetSelector.hpp"
#include "../core/RefreshSuggestionGenerator.hpp"
#include "../core/RevisionSession.hpp"
#include "../core/ReviewAnalytics.hpp"
#include "../storage/Storage.hpp"

namespace {

const char* DECK_FILE = "retain_deck.txt";
const char* EVENT_FILE = "retain_events.txt";
const char* CONFIG_FILE = "retain.conf";

std::string formatTime(std::time_t t) {
    char buf[32];
    std::tm tmv{};
    localtime_r(&t, &tmv);
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tmv);
    return buf;
}

void printTags(const ReviewItem& item) {
    if (item.tags.empty()) std::cout << "(none)";
    else {
        for (size_t j = 0; j < item.tags.size(); ++j) {
            if (j) std::cout << ", ";
            std::cout << item.tags[j];
        }
    }
}

void listAllItems(const std::vector<ScheduledItem>& items, const DecayModel& decay,
    const EngineConfig& cfg, std::time_t now) {
    std::cout << "\n===== ALL ITEMS =====\n";

    if (items.empty()) {
        std::cout << "No items stored.\n";
        return;
    }

    for (size_t i = 0; i < items.size(); i++) {
        const ScheduledItem& e = items[i];
        std::cout << i + 1 << ". " << e.item.content_ref << "\n";
        std::cout << "   Tags: ";
        printTags(e.item);
        std::cout << "\n";

        std::cout << "   Interval: " << e.state.interval_days << " days\n";
        std::cout << "   Ease: " << e.state.ease_factor << "\n";
        std::cout << "   Streak: " << e.state.streak << "  Reviews: " << e.state.review_count
            << "  Lapses: " << e.state.lapses << (e.state.isLeech(cfg) ? " (leech)" : "") << "\n";
        std::cout << "   Next review: " << formatTime(e.state.nextDueAt()) << "\n";
        std::cout << "   Retention now: " << static_cast<int>(decay.retentionProbability(e.state, now) * 100.0)
            << "%  Mastery: " << static_cast<int>(Analytics::masteryScore(e.state, cfg) * 100.0) << "%\n";
        std::cout << "-----------------------------\n";
    }
}

int askInt(const std::string& prompt, int lo, int hi) {
    while (true) {
        std::cout << prompt;
        int v;
        if (std::cin >> v && v >= lo && v <= hi) {
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            return v;
        }
        if (std::cin.eof()) return lo;
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        std::cout << "Invalid input.\n";
    }
}

ReviewGrade askGrade() {
    int q = askInt("\nHow did it go?\n"
        " 1 = AGAIN (Failed)\n"
        " 2 = HARD\n"
        " 3 = GOOD\n"
        " 4 = EASY\n> ", 1, 4);
    return static_cast<ReviewGrade>(q);
}

ScheduledItem* findById(std::vector<ScheduledItem>& items, const std::string& id) {
    auto it = std::find_if(items.begin(), items.end(),
        [&id](const ScheduledItem& e) { return e.item.id == id; });
    return it == items.end() ? nullptr : &*it;
}

void runSession(std::vector<ScheduledItem>& items, ReviewLog& log,
    const DueSetSelector& selector, const SchedulingEngine& engine) {
    std::cout << "Tag to focus on (blank = all): ";
    std::string tag;
    std::getline(std::cin, tag);

    std::vector<ScheduledItem> pool;
    for (const auto& e : items) {
        if (tag.empty() || e.item.hasTag(tag)) pool.push_back(e);
    }

    int size = askInt("Session size (1-500): ", 1, 500);

    RevisionSessionCoordinator session(selector, engine);
    if (session.start(pool, std::time(nullptr), static_cast<size_t>(size)) == 0) {
        std::cout << "No items due.\n";
        session.abandon();
        return;
    }

    while (auto next = session.nextItemId()) {
        const ScheduledItem& e = session.itemFor(*next);
        std::cout << "\nReviewing: " << e.item.content_ref << "\nTags: ";
        printTags(e.item);
        std::cout << "\n(" << session.queue().size() << " left in session)\n";

        ReviewGrade g = askGrade();
        try {
            auto result = session.submitOutcome(*next, RawSignal::graded(g), std::time(nullptr));
            log.append(result.event);
            if (ScheduledItem* stored = findById(items, *next)) {
                stored->state = result.event.resulting_state;
            }
            if (result.requeued) std::cout << "You'll see this one again shortly.\n";
            else std::cout << "Next review in " << result.event.resulting_state.interval_days << " day(s).\n";
        }
        catch (const InvalidStateError& ex) {
            // corrupted record: report and leave it for the user to fix
            std::cout << "Skipping corrupted item: " << ex.what() << "\n";
            spdlog::error("Skipping item {}: {}", *next, ex.what());
            session.abandon();
            return;
        }
        catch (const InvalidArgumentError& ex) {
            // clock is behind the item's last recorded review
            std::cout << "Could not record review: " << ex.what() << "\n";
            spdlog::error("Review of {} not recorded: {}", *next, ex.what());
            session.abandon();
            return;
        }
    }

    auto stats = session.complete(std::time(nullptr));
    std::cout << "\nSession done: " << stats.items_reviewed << " items, "
        << stats.submissions << " answers, pass rate "
        << static_cast<int>(stats.pass_rate * 100.0) << "%, "
        << stats.elapsed_seconds << "s.\n";
}

void showRefreshSuggestions(const std::vector<ScheduledItem>& items, const RefreshSuggestionGenerator& refresh) {
    int pct = askInt("Warn below retention % (1-100): ", 1, 100);
    auto list = refresh.rank(items, std::time(nullptr), pct / 100.0);
    if (list.empty()) {
        std::cout << "Nothing is fading yet.\n";
        return;
    }
    std::cout << "\n===== FADING =====\n";
    for (const auto& s : list) {
        std::cout << "- " << s.entry->item.content_ref << " : "
            << static_cast<int>(s.retention * 100.0) << "%"
            << (s.formally_due ? " (due)" : "") << "\n";
    }
}

void showStatistics(const std::vector<ScheduledItem>& items, const ReviewLog& log,
    const DueSetSelector& selector, const EngineConfig& cfg) {
    std::time_t now = std::time(nullptr);
    std::cout << "\n===== STATISTICS =====\n";
    std::cout << "Items: " << items.size() << "  Due now: " << selector.countDue(items, now)
        << "  Reviews logged: " << log.size() << "\n";

    std::cout << "Next 7 days: ";
    auto forecast = Analytics::forecastDue(items, now, 7);
    for (size_t d = 0; d < forecast.size(); ++d) {
        if (d) std::cout << " | ";
        std::cout << "+" << d << "d:" << forecast[d];
    }
    std::cout << "\n";

    for (const auto& band : Analytics::easeDistribution(items)) {
        std::cout << "   " << band.label << ": " << band.count << "\n";
    }

    if (log.empty()) return;
    auto report = Analytics::analyzePerformance(log.all(), cfg);
    std::cout << "Overall pass rate: " << static_cast<int>(report.overall_pass_rate * 100.0) << "%\n";
    std::cout << "Difficult: " << report.difficult_items.size()
        << "  Improving: " << report.improving_items.size() << "\n";
}

}

int main() {
    Log::init();

    EngineConfig cfg;
    if (loadConfigFile(cfg, CONFIG_FILE)) {
        try {
            cfg.validate();
        }
        catch (const InvalidArgumentError& e) {
            std::cerr << "Invalid " << CONFIG_FILE << ": " << e.what() << "\n";
            return 1;
        }
    }

    std::vector<ScheduledItem> items;
    ReviewLog log;
    if (!Storage::loadDeck(items, DECK_FILE) || !Storage::loadEvents(log, EVENT_FILE)) {
        std::cerr << "Failed to load saved data; see retain.log\n";
        return 1;
    }

    SchedulingEngine engine(cfg);
    DecayModel decay(cfg);
    DueSetSelector selector;
    RefreshSuggestionGenerator refresh(decay);

    while (true) {
        std::cout << "\n===== MAIN MENU =====\n"
            "1. Add Item\n"
            "2. Review Due Items\n"
            "3. List All Items\n"
            "4. Fading Topics\n"
            "5. Statistics\n"
            "6. Save & Exit\n> ";

        int choice;
        if (!(std::cin >> choice)) {
            if (std::cin.eof()) break;
            std::cin.clear(); std::string dummy; std::getline(std::cin, dummy);
            continue;
        }
        std::cin.ignore();

        if (choice == 1) {
            std::string content, tags_line;
            std::cout << "Enter content: "; std::getline(std::cin, content);
            if (content.empty()) { std::cout << "Content required.\n"; continue; }
            std::cout << "Enter tags (comma-separated): "; std::getline(std::cin, tags_line);

            std::time_t now = std::time(nullptr);
            ScheduledItem e{ ReviewItem(content, now), SchedulingState::initial(now, cfg) };
            e.item.setTags(ReviewItem::splitTagsLine(tags_line));
            items.push_back(e);

            std::cout << "Item added.\n";
        }
        else if (choice == 2) {
            runSession(items, log, selector, engine);
        }
        else if (choice == 3) {
            listAllItems(items, decay, cfg, std::time(nullptr));
        }
        else if (choice == 4) {
            showRefreshSuggestions(items, refresh);
        }
        else if (choice == 5) {
            showStatistics(items, log, selector, cfg);
        }
        else if (choice == 6) {
            break;
        }
        else std::cout << "Invalid.\n";
    }

    bool ok = Storage::saveDeck(items, DECK_FILE);
    ok = Storage::saveEvents(log, EVENT_FILE) && ok;
    if (!ok) {
        std::cout << "Error saving data.\n";
        return 1;
    }
    std::cout << "Goodbye!\n";
    return 0;
}
