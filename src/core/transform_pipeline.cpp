/*
 * mdguard C++17 - Transform Pipeline Implementation
 */
#include <mdguard/core/transform_pipeline.hpp>
#include <mdguard/core/config.hpp>
#include <mdguard/core/errors.hpp>
#include <mdguard/core/logger.hpp>
#include <mdguard/core/qa_checks.hpp>
#include <mdguard/core/thread_pool.hpp>
#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>

namespace mdguard {

// ============================================================================
// PipelineConfig
// ============================================================================

PipelineConfig PipelineConfig::from_config(const Config& config) {
    PipelineConfig settings;
    settings.max_chunk_chars = config.get_int("chunking.max_chunk_chars", settings.max_chunk_chars);
    settings.concurrency = config.get_int("pipeline.concurrency", settings.concurrency);
    settings.max_placeholders = config.get_int("preservation.max_placeholders", settings.max_placeholders);
    settings.placeholder_attempts = config.get_int("pipeline.placeholder_attempts", settings.placeholder_attempts);
    settings.validate();
    return settings;
}

void PipelineConfig::validate() const {
    if (max_chunk_chars <= 0) {
        throw ConfigError("chunking.max_chunk_chars must be positive (got " +
                          std::to_string(max_chunk_chars) + ")");
    }
    if (concurrency <= 0) {
        throw ConfigError("pipeline.concurrency must be positive (got " +
                          std::to_string(concurrency) + ")");
    }
    if (max_placeholders < 0) {
        throw ConfigError("preservation.max_placeholders must not be negative (got " +
                          std::to_string(max_placeholders) + ")");
    }
    if (placeholder_attempts <= 0) {
        throw ConfigError("pipeline.placeholder_attempts must be positive (got " +
                          std::to_string(placeholder_attempts) + ")");
    }
}

// ============================================================================
// PipelineResult
// ============================================================================

std::string PipelineResult::text() const {
    std::string out;
    for (size_t i = 0; i < outcomes.size(); ++i) {
        out += outcomes[i].text;
    }
    return out;
}

size_t PipelineResult::warning_count() const {
    size_t count = 0;
    for (size_t i = 0; i < outcomes.size(); ++i) {
        count += outcomes[i].warnings.size();
    }
    return count;
}

// ============================================================================
// TransformPipeline
// ============================================================================

namespace {

size_t count_missing_placeholders(const std::string& text, const RestorationMap& map) {
    size_t missing = 0;
    for (RestorationMap::const_iterator it = map.begin(); it != map.end(); ++it) {
        if (text.find(it->first) == std::string::npos) {
            ++missing;
        }
    }
    return missing;
}

} // anonymous namespace

ProtectedText protect_with_fallback(const std::string& text, size_t max_placeholders,
                                    bool* inline_code_skipped) {
    ProtectedText protected_text = protect(text);
    bool skipped = protected_text.map.size() > max_placeholders;
    if (skipped) {
        LOG_DEBUG("[Pipeline] %zu placeholders (limit %zu), protecting again without inline code",
                  protected_text.map.size(), max_placeholders);
        ProtectOptions options;
        options.skip_inline_code = true;
        protected_text = protect(text, options);
    }
    if (inline_code_skipped) {
        *inline_code_skipped = skipped;
    }
    return protected_text;
}

TransformPipeline::TransformPipeline(const PipelineConfig& config, TextTransformer& transformer)
    : config_(config)
    , transformer_(transformer) {
    config_.validate();
}

PipelineResult TransformPipeline::run(const std::string& document) {
    std::vector<ChunkPlanEntry> chunks;
    try {
        chunks = plan_chunks(document, config_.max_chunk_chars);
    } catch (const Error& e) {
        LOG_ERROR("[Pipeline] Planning failed: %s", e.what());
        return PipelineResult::fail("", e.what());
    }
    return run_chunks(chunks);
}

PipelineResult TransformPipeline::run_chunks(const std::vector<ChunkPlanEntry>& chunks) {
    std::vector<ChunkOutcome> outcomes(chunks.size());
    if (chunks.empty()) {
        return PipelineResult::ok(outcomes);
    }

    size_t workers = std::min(static_cast<size_t>(config_.concurrency), chunks.size());
    LOG_INFO("[Pipeline] Transforming %zu chunks with %zu workers (%s)",
             chunks.size(), workers, transformer_.name().c_str());

    std::atomic<bool> cancelled(false);
    std::mutex failure_mutex;
    bool failed = false;
    std::string failed_id;
    std::string failure;

    // First failure in time wins
    auto record_failure = [&](size_t index, const std::string& message) {
        std::lock_guard<std::mutex> lock(failure_mutex);
        if (!failed) {
            failed = true;
            failed_id = chunks[index].chunk_id;
            failure = message;
        }
    };

    std::vector<std::future<void>> futures;
    futures.reserve(chunks.size());
    {
        ThreadPool pool(workers);
        for (size_t i = 0; i < chunks.size(); ++i) {
            futures.push_back(pool.enqueue([this, i, &chunks, &outcomes, &cancelled, &record_failure]() {
                if (cancelled.load()) {
                    return;
                }
                try {
                    outcomes[i] = process_chunk(chunks[i]);
                } catch (const std::exception& e) {
                    cancelled.store(true);
                    record_failure(i, e.what());
                }
            }));
        }
        LOG_DEBUG("[Pipeline] %zu chunks queued, %zu waiting for a worker", chunks.size(), pool.pending());
        pool.shutdown();
    }

    // Every future is awaited before the result is built
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            futures[i].get();
        } catch (const std::exception& e) {
            cancelled.store(true);
            record_failure(i, e.what());
        }
    }

    if (failed) {
        LOG_ERROR("[Pipeline] Run failed at %s: %s", failed_id.c_str(), failure.c_str());
        return PipelineResult::fail(failed_id, failure);
    }

    PipelineResult result = PipelineResult::ok(outcomes);
    LOG_INFO("[Pipeline] Done: %zu chunks, %zu QA warnings", outcomes.size(), result.warning_count());
    return result;
}

ChunkOutcome TransformPipeline::process_chunk(const ChunkPlanEntry& chunk) {
    ChunkOutcome outcome;
    outcome.chunk_id = chunk.chunk_id;
    if (chunk.source_text.empty()) {
        return outcome;
    }

    ProtectedText protected_text = protect_with_fallback(chunk.source_text,
                                                         static_cast<size_t>(config_.max_placeholders),
                                                         &outcome.inline_code_skipped);
    outcome.placeholders = protected_text.map.size();

    std::string best_text;
    size_t best_missing = 0;
    size_t attempts = static_cast<size_t>(config_.placeholder_attempts);
    for (size_t attempt = 1; attempt <= attempts; ++attempt) {
        TransformResult transformed = transformer_.transform(protected_text.text);
        if (!transformed.success) {
            throw TransformError(chunk.chunk_id, "transform failed: " + transformed.error);
        }
        outcome.attempts = attempt;

        size_t missing = count_missing_placeholders(transformed.text, protected_text.map);
        if (attempt == 1 || missing < best_missing) {
            best_text = transformed.text;
            best_missing = missing;
        }
        if (missing == 0) {
            break;
        }
        LOG_DEBUG("[Pipeline] %s: attempt %zu/%zu lost %zu of %zu placeholders",
                  chunk.chunk_id.c_str(), attempt, attempts, missing, protected_text.map.size());
    }
    outcome.missing_placeholders = best_missing;

    std::string cleaned = strip_unknown_placeholders(best_text, protected_text.map);
    try {
        outcome.text = restore(cleaned, protected_text.map, false);
    } catch (const RestorationError& e) {
        throw TransformError(chunk.chunk_id, std::string("restore failed: ") + e.what());
    }

    outcome.warnings = collect_qa_warnings(chunk.source_text, outcome.text);
    for (size_t i = 0; i < outcome.warnings.size(); ++i) {
        LOG_WARN("[Pipeline] %s: %s", chunk.chunk_id.c_str(), outcome.warnings[i].c_str());
    }
    LOG_DEBUG("[Pipeline] %s: %zu -> %zu bytes, %zu placeholders",
              chunk.chunk_id.c_str(), chunk.source_text.size(), outcome.text.size(), outcome.placeholders);
    return outcome;
}

} // namespace mdguard
