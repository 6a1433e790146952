/*
 * mdguard C++17 - Chunk Planner
 *
 * Splits a Markdown document into ordered chunks no larger than a byte
 * limit. Splits prefer headings, then blank lines, then sentence ends, and
 * never fall inside a protected span (code, math, ...) when a blank line or
 * heading is available. Concatenating the chunks gives back the input exactly.
 */
#ifndef mdguard_CORE_CHUNK_PLANNER_HPP
#define mdguard_CORE_CHUNK_PLANNER_HPP

#include <mdguard/core/json.hpp>
#include <mdguard/core/span_detector.hpp>
#include <string>
#include <vector>

namespace mdguard {

// ============================================================================
// Chunk plan entry
// ============================================================================

struct ChunkPlanEntry {
    std::string chunk_id;                // "chunk-0001", ...
    std::string source_text;             // Exact slice of the document, separators included
    std::vector<std::string> separators; // Blank-line separators inside source_text, in order

    ChunkPlanEntry() {}
    ChunkPlanEntry(const std::string& id, const std::string& text, const std::vector<std::string>& seps)
        : chunk_id(id), source_text(text), separators(seps) {}
};

// ============================================================================
// Chunk Planner
// ============================================================================

class ChunkPlanner {
public:
    // Throws ConfigError if max_chunk_chars <= 0
    explicit ChunkPlanner(long long max_chunk_chars);

    // Plan `text`; empty text gives an empty plan. Throws ConfigError when a
    // blank-line separator alone exceeds the limit.
    std::vector<ChunkPlanEntry> plan(const std::string& text) const;

    size_t max_chunk_chars() const { return max_chunk_chars_; }

private:
    // A piece of text plus the separator that followed it
    struct Segment {
        std::string text;
        std::string separator;

        Segment(const std::string& t, const std::string& s) : text(t), separator(s) {}
        size_t size() const { return text.size() + separator.size(); }
    };

    struct Section {
        size_t start;
        size_t end;
    };

    std::vector<Section> split_by_headings(const std::string& text, const SpanList& spans) const;

    std::vector<Segment> split_section(const std::string& text, const Section& section,
                                       const SpanList& spans) const;

    std::vector<Segment> expand_segment(const std::string& text, const std::string& separator) const;

    std::vector<Segment> force_split(const std::string& text, const std::string& separator) const;

    // Greedy packing of one section's segments; appends to `out`
    void pack(const std::vector<Segment>& segments, std::vector<ChunkPlanEntry>& out) const;

    size_t max_chunk_chars_;
};

// plan_chunks(text, n) == ChunkPlanner(n).plan(text)
std::vector<ChunkPlanEntry> plan_chunks(const std::string& text, long long max_chunk_chars);

// Concatenate source_text in order
std::string reconstruct_chunks(const std::vector<ChunkPlanEntry>& chunks);

// [{"chunk_id": ..., "source_text": ..., "separators": [...]}, ...]
Json chunk_plan_to_json(const std::vector<ChunkPlanEntry>& chunks);

// Inverse of chunk_plan_to_json; throws RecordError naming the bad field
std::vector<ChunkPlanEntry> chunk_plan_from_json(const Json& records);

} // namespace mdguard

#endif // mdguard_CORE_CHUNK_PLANNER_HPP
