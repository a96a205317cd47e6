#include "Storage.hpp"
#include "../core/Errors.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <spdlog/spdlog.h>

namespace {

// Ids, refs and tag lines are written with \\, \n, \r, \t and \s escapes so
// neither the line-based deck nor the space-separated event log can split them.
std::string escapeField(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        case ' ': out += "\\s"; break;
        default: out += c; break;
        }
    }
    return out;
}

bool unescapeField(const std::string& encoded, std::string& out) {
    out.clear();
    for (size_t i = 0; i < encoded.size(); ++i) {
        char c = encoded[i];
        if (c != '\\') {
            out += c;
            continue;
        }
        if (++i == encoded.size()) return false;
        switch (encoded[i]) {
        case '\\': out += '\\'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        case 's': out += ' '; break;
        default: return false;
        }
    }
    return true;
}

std::string encodeSignal(const RawSignal& s) {
    std::ostringstream oss;
    oss << std::setprecision(17);
    if (s.self_rating) {
        oss << "r:" << *s.self_rating;
    }
    else if (s.grade) {
        oss << "g:" << static_cast<int>(*s.grade);
    }
    else if (s.correct) {
        oss << "c:" << (*s.correct ? 1 : 0) << ":";
        if (s.response_seconds) oss << *s.response_seconds;
        else oss << "-";
    }
    else {
        oss << "-";
    }
    return oss.str();
}

bool decodeSignal(const std::string& token, RawSignal& out) {
    out = RawSignal{};
    if (token == "-") return true;
    if (token.size() < 3 || token[1] != ':') return false;

    std::string body = token.substr(2);
    try {
        switch (token[0]) {
        case 'r':
            out.self_rating = std::stod(body);
            return true;
        case 'g': {
            int g = std::stoi(body);
            if (g < 1 || g > 4) return false;
            out.grade = static_cast<ReviewGrade>(g);
            return true;
        }
        case 'c': {
            auto sep = body.find(':');
            if (sep == std::string::npos) return false;
            out.correct = body.substr(0, sep) == "1";
            std::string secs = body.substr(sep + 1);
            if (secs != "-") out.response_seconds = std::stod(secs);
            return true;
        }
        default:
            return false;
        }
    }
    catch (const std::exception&) {
        return false;
    }
}

} // namespace

std::string Storage::serializeDeck(const std::vector<ScheduledItem>& items) {
    std::ostringstream oss;
    oss << std::setprecision(17);

    for (const auto& e : items) {
        const SchedulingState& s = e.state;
        oss << escapeField(e.item.id) << "\n"
            << escapeField(e.item.content_ref) << "\n"
            << e.item.created_at << "\n"
            << escapeField(e.item.tagsAsLine()) << "\n"
            << s.ease_factor << " " << s.interval_days << " " << s.streak << " "
            << s.review_count << " " << s.lapses << "\n";

        if (s.last_reviewed_at) oss << *s.last_reviewed_at << "\n";
        else oss << "-\n";

        oss << s.decay_half_life_days << "\n"
            << "---\n";
    }

    return oss.str();
}

bool Storage::parseDeck(const std::string& plain, std::vector<ScheduledItem>& items) {
    std::istringstream iss(plain);
    items.clear();

    while (true) {
        ScheduledItem e;
        std::string line;
        if (!std::getline(iss, line)) break;
        if (line.empty()) {
            if (iss.peek() == std::char_traits<char>::eof()) break;
            spdlog::error("Deck: empty item id");
            return false;
        }
        if (!unescapeField(line, e.item.id)) {
            spdlog::error("Deck: bad escape in item id '{}'", line);
            return false;
        }

        if (!std::getline(iss, line)) return false;
        if (!unescapeField(line, e.item.content_ref)) {
            spdlog::error("Deck: bad escape in content ref for item {}", e.item.id);
            return false;
        }

        if (!std::getline(iss, line)) return false;
        try {
            e.item.created_at = static_cast<std::time_t>(std::stoll(line));
        }
        catch (const std::exception&) {
            spdlog::error("Deck: bad created_at '{}' for item {}", line, e.item.id);
            return false;
        }

        if (!std::getline(iss, line)) return false;
        std::string tagLine;
        if (!unescapeField(line, tagLine)) {
            spdlog::error("Deck: bad escape in tags for item {}", e.item.id);
            return false;
        }
        e.item.tags = ReviewItem::splitTagsLine(tagLine);

        SchedulingState& s = e.state;
        s.created_at = e.item.created_at;

        if (!std::getline(iss, line)) return false;
        std::istringstream nums(line);
        if (!(nums >> s.ease_factor >> s.interval_days >> s.streak >> s.review_count >> s.lapses)) {
            spdlog::error("Deck: bad scheduling line for item {}", e.item.id);
            return false;
        }

        if (!std::getline(iss, line)) return false;
        if (line != "-") {
            try {
                s.last_reviewed_at = static_cast<std::time_t>(std::stoll(line));
            }
            catch (const std::exception&) {
                spdlog::error("Deck: bad last_reviewed_at '{}' for item {}", line, e.item.id);
                return false;
            }
        }

        if (!std::getline(iss, line)) return false;
        try {
            s.decay_half_life_days = std::stod(line);
        }
        catch (const std::exception&) {
            spdlog::error("Deck: bad half-life '{}' for item {}", line, e.item.id);
            return false;
        }

        std::getline(iss, line); // ---
        items.push_back(e);
    }

    return true;
}

bool Storage::saveDeck(const std::vector<ScheduledItem>& items, const std::string& filename) {
    spdlog::info("Saving {} items to '{}'", items.size(), filename);
    for (const auto& e : items) {
        if (e.item.id.empty()) {
            spdlog::error("Refusing to save deck '{}': item with empty id", filename);
            return false;
        }
    }

    std::ofstream out(filename, std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for writing deck", filename);
        return false;
    }
    out << serializeDeck(items);
    return static_cast<bool>(out);
}

bool Storage::loadDeck(std::vector<ScheduledItem>& items, const std::string& filename) {
    spdlog::info("Loading deck from '{}'", filename);
    items.clear();

    std::ifstream in(filename);
    if (!in) {
        spdlog::warn("Deck file '{}' not found; treating as empty", filename);
        return true;
    }

    std::ostringstream oss;
    oss << in.rdbuf();
    if (!parseDeck(oss.str(), items)) {
        spdlog::error("Deck file '{}' is malformed", filename);
        items.clear();
        return false;
    }

    spdlog::info("Loaded {} items", items.size());
    return true;
}

bool Storage::saveEvents(const ReviewLog& log, const std::string& filename) {
    spdlog::info("Saving {} review events to '{}'", log.size(), filename);
    auto events = log.all();
    for (const auto& ev : events) {
        if (ev.item_id.empty()) {
            spdlog::error("Refusing to save events '{}': event with empty item id", filename);
            return false;
        }
    }

    std::ofstream out(filename, std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for writing events", filename);
        return false;
    }

    out << std::setprecision(17);
    for (const auto& ev : events) {
        const SchedulingState& s = ev.resulting_state;
        out << escapeField(ev.item_id) << " "
            << ev.timestamp << " "
            << ev.quality << " "
            << encodeSignal(ev.raw) << " "
            << s.ease_factor << " "
            << s.interval_days << " "
            << s.streak << " "
            << s.review_count << " "
            << s.lapses << " "
            << s.decay_half_life_days << " "
            << s.created_at << "\n";
    }
    return static_cast<bool>(out);
}

bool Storage::loadEvents(ReviewLog& log, const std::string& filename) {
    spdlog::info("Loading review events from '{}'", filename);

    std::ifstream in(filename);
    if (!in) {
        spdlog::warn("Event file '{}' not found; treating as empty", filename);
        return true;
    }

    std::string line;
    size_t lineNo = 0;
    size_t loaded = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.empty()) continue;

        std::istringstream iss(line);
        ReviewEvent ev;
        std::string id;
        std::string signal;
        SchedulingState& s = ev.resulting_state;
        if (!(iss >> id >> ev.timestamp >> ev.quality >> signal
                >> s.ease_factor >> s.interval_days >> s.streak >> s.review_count
                >> s.lapses >> s.decay_half_life_days >> s.created_at)
            || !unescapeField(id, ev.item_id) || ev.item_id.empty()
            || !decodeSignal(signal, ev.raw)) {
            spdlog::error("Event file '{}': malformed line {}", filename, lineNo);
            return false;
        }
        s.last_reviewed_at = ev.timestamp;

        try {
            log.append(ev);
        }
        catch (const InvalidArgumentError& e) {
            spdlog::error("Event file '{}': line {}: {}", filename, lineNo, e.what());
            return false;
        }
        ++loaded;
    }

    spdlog::info("Loaded {} review events", loaded);
    return true;
}
