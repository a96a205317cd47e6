#pragma once
#include <string>
#include <ctime>
#include <vector>
#include <spdlog/spdlog.h>

// A learnable unit (flashcard, topic, note fragment). The caller owns it;
// the engine only reads the id, creation time and tags.
class ReviewItem {
public:
    ReviewItem() = default;
    ReviewItem(const std::string& contentRef, std::time_t createdAt);
    ReviewItem(const std::string& id, const std::string& contentRef, std::time_t createdAt);

    std::string id;              // Auto-generated unless supplied
    std::string content_ref;     // Opaque to the engine
    std::time_t created_at = 0;  // Seconds since epoch

    // Tags (membership only, order irrelevant)
    std::vector<std::string> tags;

    void addTag(const std::string& tag);
    bool removeTag(const std::string& tag); // returns true if removed
    bool hasTag(const std::string& tag) const;
    void setTags(const std::vector<std::string>& newTags);
    std::string tagsAsLine() const; // CSV single line for storage

    static std::vector<std::string> splitTagsLine(const std::string& line);
    static std::string generateID();
};
