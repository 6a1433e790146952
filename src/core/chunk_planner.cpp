/*
 * mdguard C++17 - Chunk Planner Implementation
 *
 * Pipeline per document:
 *   1. sections at heading lines (not inside protected spans)
 *   2. segments at blank-line runs (not overlapping protected spans)
 *   3. oversized segments force-split at sentence end / newline / space / hard cut
 *   4. greedy packing of segments into chunks, per section
 *   5. chunk ids
 */
#include <mdguard/core/chunk_planner.hpp>
#include <mdguard/core/errors.hpp>
#include <mdguard/core/logger.hpp>
#include <mdguard/core/schema.hpp>
#include <mdguard/core/utils.hpp>
#include <algorithm>

namespace mdguard {

namespace {

bool span_starts_before(size_t value, const ProtectedSpan& span) {
    return value < span.start;
}

// Spans are sorted and disjoint, so their ends are sorted too: only the last
// span starting before `end` can reach past `start`.
bool overlaps_spans(size_t start, size_t end, const SpanList& spans) {
    if (start >= end) return false;
    SpanList::const_iterator it = std::upper_bound(spans.begin(), spans.end(), end - 1, span_starts_before);
    if (it == spans.begin()) return false;
    --it;
    return it->end > start;
}

bool inside_span(size_t index, const SpanList& spans) {
    return overlaps_spans(index, index + 1, spans);
}

// [ \t]{0,3} #{1,6} [ \t]+
bool is_heading_line(const std::string& line) {
    size_t i = 0;
    while (i < line.size() && is_blank(line[i])) ++i;
    if (i > 3) return false;
    size_t hashes = count_run(line, i, '#');
    if (hashes < 1 || hashes > 6) return false;
    i += hashes;
    return i < line.size() && is_blank(line[i]);
}

// Length of a line break ("\n" or "\r\n") at `pos`, 0 if none
size_t line_break_at(const std::string& text, size_t pos, size_t end) {
    if (pos < end && text[pos] == '\n') return 1;
    if (pos + 1 < end && text[pos] == '\r' && text[pos + 1] == '\n') return 2;
    return 0;
}

// End of a blank-line run starting at `pos`: two or more line breaks, each
// followed by optional blanks. Returns `pos` when there is no run.
size_t blank_run_end(const std::string& text, size_t pos, size_t end) {
    size_t cursor = pos;
    size_t breaks = 0;
    while (true) {
        size_t len = line_break_at(text, cursor, end);
        if (len == 0) break;
        cursor += len;
        while (cursor < end && is_blank(text[cursor])) ++cursor;
        ++breaks;
    }
    return breaks >= 2 ? cursor : pos;
}

bool follows_sentence_end(const std::string& s, size_t pos) {
    if (pos == 0) return false;
    char prev = s[pos - 1];
    if (prev == '.' || prev == '!' || prev == '?') return true;
    // Full-width 。！？ in UTF-8
    if (pos >= 3) {
        std::string tail = s.substr(pos - 3, 3);
        return tail == "\xE3\x80\x82" || tail == "\xEF\xBC\x81" || tail == "\xEF\xBC\x9F";
    }
    return false;
}

// End of the last whitespace run after sentence punctuation inside s[0, limit), or 0
size_t last_sentence_break(const std::string& s, size_t limit) {
    size_t best = 0;
    size_t i = 0;
    while (i < limit) {
        if (is_space(s[i]) && follows_sentence_end(s, i)) {
            size_t j = i;
            while (j < limit && is_space(s[j])) ++j;
            best = j;
            i = j;
            continue;
        }
        ++i;
    }
    return best;
}

// Last occurrence of `c` in s[0, limit), or 0 when absent (a cut at 0 is useless)
size_t last_char_before(const std::string& s, char c, size_t limit) {
    if (limit == 0) return 0;
    size_t pos = s.rfind(c, limit - 1);
    return pos == std::string::npos ? 0 : pos;
}

} // anonymous namespace

// ============================================================================
// ChunkPlanner
// ============================================================================

ChunkPlanner::ChunkPlanner(long long max_chunk_chars) : max_chunk_chars_(0) {
    if (max_chunk_chars <= 0) {
        throw ConfigError("max_chunk_chars must be positive (got " + std::to_string(max_chunk_chars) + ")");
    }
    max_chunk_chars_ = static_cast<size_t>(max_chunk_chars);
}

std::vector<ChunkPlanEntry> ChunkPlanner::plan(const std::string& text) const {
    std::vector<ChunkPlanEntry> chunks;
    if (text.empty()) {
        return chunks;
    }

    SpanList spans = find_protected_spans(text);
    std::vector<Section> sections = split_by_headings(text, spans);

    for (size_t i = 0; i < sections.size(); ++i) {
        pack(split_section(text, sections[i], spans), chunks);
    }

    size_t width = std::max<size_t>(4, std::to_string(chunks.size()).size());
    for (size_t i = 0; i < chunks.size(); ++i) {
        chunks[i].chunk_id = "chunk-" + zero_pad(i + 1, width);
    }

    LOG_DEBUG("[ChunkPlanner] %zu bytes -> %zu sections, %zu chunks (limit %zu, %zu protected spans)",
              text.size(), sections.size(), chunks.size(), max_chunk_chars_, spans.size());
    return chunks;
}

std::vector<ChunkPlanner::Section> ChunkPlanner::split_by_headings(const std::string& text,
                                                                  const SpanList& spans) const {
    std::vector<size_t> boundaries(1, 0);
    std::vector<std::string> lines = split_lines_keep_ends(text);
    size_t offset = 0;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (is_heading_line(lines[i]) && !inside_span(offset, spans) && offset != boundaries.back()) {
            boundaries.push_back(offset);
        }
        offset += lines[i].size();
    }
    if (boundaries.back() != text.size()) {
        boundaries.push_back(text.size());
    }

    std::vector<Section> sections;
    for (size_t i = 0; i + 1 < boundaries.size(); ++i) {
        Section section;
        section.start = boundaries[i];
        section.end = boundaries[i + 1];
        sections.push_back(section);
    }
    return sections;
}

std::vector<ChunkPlanner::Segment> ChunkPlanner::split_section(const std::string& text,
                                                              const Section& section,
                                                              const SpanList& spans) const {
    std::vector<Segment> segments;
    size_t last = section.start;
    size_t i = section.start;

    while (i < section.end) {
        size_t run_end = line_break_at(text, i, section.end) ? blank_run_end(text, i, section.end) : i;
        if (run_end == i) {
            ++i;
            continue;
        }
        if (!overlaps_spans(i, run_end, spans)) {
            std::vector<Segment> parts = expand_segment(text.substr(last, i - last),
                                                        text.substr(i, run_end - i));
            segments.insert(segments.end(), parts.begin(), parts.end());
            last = run_end;
        }
        i = run_end;
    }

    std::vector<Segment> tail = expand_segment(text.substr(last, section.end - last), "");
    segments.insert(segments.end(), tail.begin(), tail.end());
    return segments;
}

std::vector<ChunkPlanner::Segment> ChunkPlanner::expand_segment(const std::string& text,
                                                               const std::string& separator) const {
    std::vector<Segment> segments;
    if (text.empty() && separator.empty()) {
        return segments;
    }
    if (text.size() > max_chunk_chars_) {
        return force_split(text, separator);
    }
    if (text.size() + separator.size() <= max_chunk_chars_) {
        segments.push_back(Segment(text, separator));
        return segments;
    }
    if (separator.size() > max_chunk_chars_) {
        throw ConfigError("blank-line separator of " + std::to_string(separator.size()) +
                          " bytes exceeds max_chunk_chars " + std::to_string(max_chunk_chars_));
    }
    // Text fits alone; the separator becomes its own unit
    segments.push_back(Segment(text, ""));
    segments.push_back(Segment("", separator));
    return segments;
}

std::vector<ChunkPlanner::Segment> ChunkPlanner::force_split(const std::string& text,
                                                            const std::string& separator) const {
    std::vector<Segment> segments;
    std::string remaining = text;

    while (remaining.size() > max_chunk_chars_) {
        size_t cut = max_chunk_chars_;
        size_t best = last_sentence_break(remaining, cut);
        if (best == 0) best = last_char_before(remaining, '\n', cut);
        if (best == 0) best = last_char_before(remaining, ' ', cut);
        if (best == 0) best = utf8_floor(remaining, cut);
        // A limit smaller than one character leaves no boundary to respect
        if (best == 0) best = cut;

        segments.push_back(Segment(remaining.substr(0, best), ""));
        remaining.erase(0, best);
    }

    // The last fragment takes the separator under the same rules as any segment
    std::vector<Segment> last = expand_segment(remaining, separator);
    segments.insert(segments.end(), last.begin(), last.end());

    LOG_DEBUG("[ChunkPlanner] Force-split %zu bytes into %zu pieces", text.size(), segments.size());
    return segments;
}

void ChunkPlanner::pack(const std::vector<Segment>& segments, std::vector<ChunkPlanEntry>& out) const {
    ChunkPlanEntry current;
    for (size_t i = 0; i < segments.size(); ++i) {
        const Segment& segment = segments[i];
        if (segment.size() > max_chunk_chars_) {
            throw PlanInvariantError("segment of " + std::to_string(segment.size()) +
                                     " bytes exceeds max_chunk_chars " + std::to_string(max_chunk_chars_) +
                                     " after splitting");
        }
        if (!current.source_text.empty() && current.source_text.size() + segment.size() > max_chunk_chars_) {
            out.push_back(current);
            current = ChunkPlanEntry();
        }
        current.source_text += segment.text;
        current.source_text += segment.separator;
        if (!segment.separator.empty()) {
            current.separators.push_back(segment.separator);
        }
    }
    if (!current.source_text.empty()) {
        out.push_back(current);
    }
}

// ============================================================================
// Free functions
// ============================================================================

std::vector<ChunkPlanEntry> plan_chunks(const std::string& text, long long max_chunk_chars) {
    return ChunkPlanner(max_chunk_chars).plan(text);
}

std::string reconstruct_chunks(const std::vector<ChunkPlanEntry>& chunks) {
    std::string text;
    for (size_t i = 0; i < chunks.size(); ++i) {
        text += chunks[i].source_text;
    }
    return text;
}

Json chunk_plan_to_json(const std::vector<ChunkPlanEntry>& chunks) {
    Json records = Json::array();
    for (size_t i = 0; i < chunks.size(); ++i) {
        Json record = Json::object();
        record["chunk_id"] = chunks[i].chunk_id;
        record["source_text"] = chunks[i].source_text;
        record["separators"] = chunks[i].separators;
        records.push_back(record);
    }
    return records;
}

std::vector<ChunkPlanEntry> chunk_plan_from_json(const Json& records) {
    schema::require_array<RecordError>(records, "chunk plan");

    std::vector<ChunkPlanEntry> chunks;
    for (size_t i = 0; i < records.size(); ++i) {
        std::string label = "chunk plan[" + std::to_string(i) + "]";
        const Json& record = schema::require_object<RecordError>(records[i], label);

        ChunkPlanEntry entry;
        entry.chunk_id = schema::require_string<RecordError>(
            schema::require_member<RecordError>(record, "chunk_id", label), label + ".chunk_id");
        entry.source_text = schema::require_string<RecordError>(
            schema::require_member<RecordError>(record, "source_text", label), label + ".source_text");
        entry.separators = schema::require_string_list<RecordError>(
            schema::require_member<RecordError>(record, "separators", label), label + ".separators");
        chunks.push_back(entry);
    }
    return chunks;
}

} // namespace mdguard
