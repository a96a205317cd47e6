#include "ReviewItem.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <random>
#include <sstream>

namespace {

std::string trimTag(const std::string& tag) {
    std::string t = tag;
    while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
    while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
    return t;
}

} // namespace

ReviewItem::ReviewItem(const std::string& contentRef, std::time_t createdAt)
    : ReviewItem(generateID(), contentRef, createdAt)
{
}

ReviewItem::ReviewItem(const std::string& itemId, const std::string& contentRef, std::time_t createdAt)
    : id(itemId), content_ref(contentRef), created_at(createdAt)
{
    spdlog::debug("Created ReviewItem: ID={}, ref={}", id, content_ref);
}

void ReviewItem::addTag(const std::string& tag) {
    std::string t = trimTag(tag);
    if (t.empty()) return;

    if (!hasTag(t)) {
        tags.push_back(t);
        spdlog::debug("ReviewItem ID={} addTag '{}'", id, t);
    }
}

bool ReviewItem::removeTag(const std::string& tag) {
    auto it = std::find(tags.begin(), tags.end(), trimTag(tag));
    if (it != tags.end()) {
        tags.erase(it);
        spdlog::debug("ReviewItem ID={} removeTag '{}'", id, tag);
        return true;
    }
    return false;
}

bool ReviewItem::hasTag(const std::string& tag) const {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

void ReviewItem::setTags(const std::vector<std::string>& newTags) {
    tags.clear();
    for (const auto& t : newTags) {
        addTag(t);
    }
    spdlog::debug("ReviewItem ID={} setTags count={}", id, tags.size());
}

std::string ReviewItem::tagsAsLine() const {
    std::ostringstream oss;
    for (size_t i = 0; i < tags.size(); ++i) {
        if (i) oss << ",";
        oss << tags[i];
    }
    return oss.str();
}

std::vector<std::string> ReviewItem::splitTagsLine(const std::string& line) {
    std::vector<std::string> out;
    std::istringstream iss(line);
    std::string t;
    while (std::getline(iss, t, ',')) {
        t = trimTag(t);
        if (!t.empty() && std::find(out.begin(), out.end(), t) == out.end())
            out.push_back(t);
    }
    return out;
}

// "ri-" + creation millis + a per-thread random stream mixed with a counter,
// so two ids minted in the same millisecond on one thread still differ.
std::string ReviewItem::generateID() {
    static std::atomic<std::uint32_t> counter{0};
    thread_local std::mt19937_64 rng{std::random_device{}()};

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::uint64_t salt = rng() ^ counter.fetch_add(1, std::memory_order_relaxed);

    char buf[48];
    std::snprintf(buf, sizeof(buf), "ri-%llx-%012llx",
        static_cast<unsigned long long>(millis),
        static_cast<unsigned long long>(salt & 0xffffffffffffULL));
    return buf;
}
