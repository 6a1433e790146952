/*
 * mdguard C++17 - Transform Pipeline
 *
 * Plans a document into chunks and runs protect -> transform -> restore on
 * each chunk in a worker pool. Output keeps chunk order.
 */
#ifndef mdguard_CORE_TRANSFORM_PIPELINE_HPP
#define mdguard_CORE_TRANSFORM_PIPELINE_HPP

#include <mdguard/core/chunk_planner.hpp>
#include <mdguard/core/preservation.hpp>
#include <string>
#include <vector>

namespace mdguard {

class Config;

// ============================================================================
// Settings
// ============================================================================

struct PipelineConfig {
    long long max_chunk_chars;   // Chunk size limit in bytes (default: 8000)
    long long concurrency;       // Worker threads (default: 3)
    long long max_placeholders;  // Above this, protect again without inline code (default: 30)
    long long placeholder_attempts;  // Transform calls per chunk while placeholders go missing (default: 3)

    PipelineConfig()
        : max_chunk_chars(8000)
        , concurrency(3)
        , max_placeholders(30)
        , placeholder_attempts(3) {}

    // Read chunking.max_chunk_chars, pipeline.concurrency,
    // pipeline.placeholder_attempts and preservation.max_placeholders;
    // throws ConfigError on bad values
    static PipelineConfig from_config(const Config& config);

    // Throws ConfigError on non-positive limits
    void validate() const;
};

// ============================================================================
// Transformer contract
// ============================================================================

struct TransformResult {
    bool success;
    std::string text;
    std::string error;

    TransformResult() : success(false) {}

    static TransformResult ok(const std::string& text) {
        TransformResult r;
        r.success = true;
        r.text = text;
        return r;
    }

    static TransformResult fail(const std::string& err) {
        TransformResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

// Rewrites protected chunk text. Called from several worker threads at
// once, so implementations must be thread-safe. Output is never trusted.
class TextTransformer {
public:
    virtual ~TextTransformer() {}

    virtual TransformResult transform(const std::string& text) = 0;

    virtual std::string name() const = 0;
};

// Returns its input unchanged
class IdentityTransformer : public TextTransformer {
public:
    TransformResult transform(const std::string& text) override {
        return TransformResult::ok(text);
    }

    std::string name() const override { return "identity"; }
};

// ============================================================================
// Results
// ============================================================================

struct ChunkOutcome {
    std::string chunk_id;
    std::string text;                   // Restored chunk text
    std::vector<std::string> warnings;  // "QA warning: ..." lines
    size_t placeholders;                // Spans protected for this chunk
    bool inline_code_skipped;           // Protected a second time without inline code
    size_t attempts;                    // Transform calls made
    size_t missing_placeholders;        // Absent from the kept transform output

    ChunkOutcome() : placeholders(0), inline_code_skipped(false), attempts(0), missing_placeholders(0) {}
};

struct PipelineResult {
    bool success;
    std::vector<ChunkOutcome> outcomes;  // In chunk order
    std::string error;
    std::string failed_chunk_id;

    PipelineResult() : success(false) {}

    static PipelineResult ok(const std::vector<ChunkOutcome>& outcomes) {
        PipelineResult r;
        r.success = true;
        r.outcomes = outcomes;
        return r;
    }

    static PipelineResult fail(const std::string& chunk_id, const std::string& err) {
        PipelineResult r;
        r.success = false;
        r.failed_chunk_id = chunk_id;
        r.error = err;
        return r;
    }

    // Outcome texts concatenated in chunk order
    std::string text() const;

    size_t warning_count() const;
};

// ============================================================================
// Pipeline
// ============================================================================

// protect(); when more than `max_placeholders` spans were protected, protect
// again leaving inline code in place and set *inline_code_skipped
ProtectedText protect_with_fallback(const std::string& text, size_t max_placeholders,
                                    bool* inline_code_skipped = nullptr);

class TransformPipeline {
public:
    // Throws ConfigError if `config` is invalid. `transformer` must outlive
    // the pipeline.
    TransformPipeline(const PipelineConfig& config, TextTransformer& transformer);

    // Plan `document`, then run_chunks()
    PipelineResult run(const std::string& document);

    // Process every chunk; the first failure cancels chunks not yet started
    // and fails the whole run. The reported error is the first one raised in
    // time, which is not always the lowest chunk index.
    PipelineResult run_chunks(const std::vector<ChunkPlanEntry>& chunks);

    // One protect -> transform -> restore cycle. The transform is called
    // again, up to placeholder_attempts times, while its output lacks any
    // placeholder; the output missing the fewest is kept. Throws on failure.
    ChunkOutcome process_chunk(const ChunkPlanEntry& chunk);

    const PipelineConfig& config() const { return config_; }

private:
    PipelineConfig config_;
    TextTransformer& transformer_;
};

} // namespace mdguard

#endif // mdguard_CORE_TRANSFORM_PIPELINE_HPP
