#include <gtest/gtest.h>
#include <mdguard/core/transform_pipeline.hpp>
#include <mdguard/core/config.hpp>
#include <mdguard/core/errors.hpp>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace mdguard;

namespace {

// First calls sleep longest so later chunks finish first
class SlowTransformer : public TextTransformer {
public:
    SlowTransformer() : calls_(0) {}

    TransformResult transform(const std::string& text) override {
        int call = calls_.fetch_add(1);
        int delay = call < 4 ? (4 - call) * 15 : 0;
        std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        return TransformResult::ok(text);
    }

    std::string name() const override { return "slow"; }

private:
    std::atomic<int> calls_;
};

// Fails any chunk containing "FAIL"
class FailingTransformer : public TextTransformer {
public:
    FailingTransformer() : calls(0) {}

    TransformResult transform(const std::string& text) override {
        calls.fetch_add(1);
        if (text.find("FAIL") != std::string::npos) {
            return TransformResult::fail("boom");
        }
        return TransformResult::ok(text);
    }

    std::string name() const override { return "failing"; }

    std::atomic<int> calls;
};

// Removes every occurrence of one token
class DroppingTransformer : public TextTransformer {
public:
    explicit DroppingTransformer(const std::string& token) : token_(token) {}

    TransformResult transform(const std::string& text) override {
        std::string out = text;
        size_t pos = out.find(token_);
        while (pos != std::string::npos) {
            out.erase(pos, token_.size());
            pos = out.find(token_, pos);
        }
        return TransformResult::ok(out);
    }

    std::string name() const override { return "dropping"; }

private:
    std::string token_;
};

// Removes `token` on the first call only
class ForgetfulOnceTransformer : public TextTransformer {
public:
    explicit ForgetfulOnceTransformer(const std::string& token) : calls(0), token_(token) {}

    TransformResult transform(const std::string& text) override {
        if (calls.fetch_add(1) > 0) {
            return TransformResult::ok(text);
        }
        std::string out = text;
        size_t pos = out.find(token_);
        if (pos != std::string::npos) {
            out.erase(pos, token_.size());
        }
        return TransformResult::ok(out);
    }

    std::string name() const override { return "forgetful-once"; }

    std::atomic<int> calls;

private:
    std::string token_;
};

// "SLOW" chunks fail late, "FAIL" chunks fail at once
class StaggeredFailureTransformer : public TextTransformer {
public:
    TransformResult transform(const std::string& text) override {
        if (text.find("SLOW") != std::string::npos) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            return TransformResult::fail("late");
        }
        if (text.find("FAIL") != std::string::npos) {
            return TransformResult::fail("early");
        }
        return TransformResult::ok(text);
    }

    std::string name() const override { return "staggered"; }
};

// Appends a token that was never issued
class InjectingTransformer : public TextTransformer {
public:
    TransformResult transform(const std::string& text) override {
        return TransformResult::ok(text + "__HTML_777__");
    }

    std::string name() const override { return "injecting"; }
};

PipelineConfig make_config(long long max_chunk_chars, long long concurrency) {
    PipelineConfig config;
    config.max_chunk_chars = max_chunk_chars;
    config.concurrency = concurrency;
    return config;
}

const char* kDocument =
    "# Intro\n\nSome text with `code` and $x^2$.\n\n"
    "## Links\n\nSee [docs](https://example.com/docs) and <b>bold</b>.\n\n"
    "```cpp\nint main() { return 0; }\n```\n\n"
    "## Math\n\n$$\na + b\n$$\n\nTrailing paragraph that is a little longer than the others.\n";

} // anonymous namespace

// ============================================================================
// Settings
// ============================================================================

TEST(PipelineConfigTest, FromConfig) {
    Config config;
    ASSERT_TRUE(config.load_string("{\"chunking\": {\"max_chunk_chars\": 100},"
                                   " \"pipeline\": {\"concurrency\": 2}}"));
    PipelineConfig settings = PipelineConfig::from_config(config);
    EXPECT_EQ(settings.max_chunk_chars, 100);
    EXPECT_EQ(settings.concurrency, 2);
    EXPECT_EQ(settings.max_placeholders, 30);
    EXPECT_EQ(settings.placeholder_attempts, 3);

    config.set_int("pipeline.placeholder_attempts", 5);
    EXPECT_EQ(PipelineConfig::from_config(config).placeholder_attempts, 5);
}

TEST(PipelineConfigTest, RejectsBadValues) {
    Config config;
    config.set_int("pipeline.concurrency", 0);
    EXPECT_THROW(PipelineConfig::from_config(config), ConfigError);

    Config negative;
    negative.set_int("chunking.max_chunk_chars", -5);
    EXPECT_THROW(PipelineConfig::from_config(negative), ConfigError);

    Config wrong_type;
    wrong_type.set_string("preservation.max_placeholders", "many");
    EXPECT_THROW(PipelineConfig::from_config(wrong_type), ConfigError);

    Config no_attempts;
    no_attempts.set_int("pipeline.placeholder_attempts", 0);
    EXPECT_THROW(PipelineConfig::from_config(no_attempts), ConfigError);

    IdentityTransformer identity;
    EXPECT_THROW({ TransformPipeline pipeline(make_config(0, 1), identity); }, ConfigError);
}

// ============================================================================
// protect_with_fallback
// ============================================================================

TEST(ProtectFallbackTest, SkipsInlineCodeOverLimit) {
    std::string text = "`a` `b` $x$";
    bool skipped = true;

    ProtectedText full = protect_with_fallback(text, 30, &skipped);
    EXPECT_FALSE(skipped);
    EXPECT_EQ(full.map.size(), 3u);

    ProtectedText reduced = protect_with_fallback(text, 0, &skipped);
    EXPECT_TRUE(skipped);
    EXPECT_EQ(reduced.map.size(), 1u);
    EXPECT_EQ(reduced.text, "`a` `b` __MATH_INLINE_001__");
}

// ============================================================================
// Runs
// ============================================================================

TEST(TransformPipelineTest, IdentityReproducesDocument) {
    IdentityTransformer identity;
    TransformPipeline pipeline(make_config(60, 3), identity);
    PipelineResult result = pipeline.run(kDocument);

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_GT(result.outcomes.size(), 1u);
    EXPECT_EQ(result.text(), kDocument);
    EXPECT_EQ(result.outcomes[0].chunk_id, "chunk-0001");
}

TEST(TransformPipelineTest, EmptyDocument) {
    IdentityTransformer identity;
    TransformPipeline pipeline(make_config(100, 2), identity);
    PipelineResult result = pipeline.run("");
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.outcomes.empty());
    EXPECT_EQ(result.text(), "");
}

TEST(TransformPipelineTest, OutputKeepsChunkOrder) {
    SlowTransformer slow;
    TransformPipeline pipeline(make_config(40, 4), slow);
    PipelineResult result = pipeline.run(kDocument);

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.text(), kDocument);
    for (size_t i = 1; i < result.outcomes.size(); ++i) {
        EXPECT_LT(result.outcomes[i - 1].chunk_id, result.outcomes[i].chunk_id);
    }
}

TEST(TransformPipelineTest, FailedChunkFailsTheRun) {
    FailingTransformer failing;
    TransformPipeline pipeline(make_config(1000, 3), failing);
    PipelineResult result = pipeline.run("# A\n\nok\n\n# B\n\nFAIL here\n\n# C\n\nok too\n");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failed_chunk_id, "chunk-0002");
    EXPECT_NE(result.error.find("transform failed"), std::string::npos);
    EXPECT_NE(result.error.find("boom"), std::string::npos);
    EXPECT_TRUE(result.outcomes.empty());
}

TEST(TransformPipelineTest, FailureCancelsPendingChunks) {
    FailingTransformer failing;
    TransformPipeline pipeline(make_config(1000, 1), failing);
    PipelineResult result = pipeline.run("FAIL\n\n# B\n\nx\n\n# C\n\ny\n");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failed_chunk_id, "chunk-0001");
    EXPECT_EQ(failing.calls.load(), 1);
}

TEST(TransformPipelineTest, DroppedPlaceholderIsAWarning) {
    DroppingTransformer dropping("__URL_001__");
    TransformPipeline pipeline(make_config(1000, 1), dropping);
    PipelineResult result = pipeline.run("See [link](https://example.com) now.");

    ASSERT_TRUE(result.success) << result.error;
    ASSERT_EQ(result.outcomes.size(), 1u);
    EXPECT_EQ(result.outcomes[0].text, "See [link]() now.");
    EXPECT_EQ(result.outcomes[0].placeholders, 1u);

    bool url_warning = false;
    for (size_t i = 0; i < result.outcomes[0].warnings.size(); ++i) {
        if (result.outcomes[0].warnings[i].find("URL target mismatch") != std::string::npos) {
            url_warning = true;
        }
    }
    EXPECT_TRUE(url_warning);
    EXPECT_GE(result.warning_count(), 1u);
}

TEST(TransformPipelineTest, UnknownPlaceholderIsStripped) {
    InjectingTransformer injecting;
    TransformPipeline pipeline(make_config(1000, 2), injecting);
    PipelineResult result = pipeline.run("Use `x` here.");

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.text(), "Use `x` here.");
    EXPECT_EQ(result.warning_count(), 0u);
}

TEST(TransformPipelineTest, ChunkOverPlaceholderLimitKeepsInlineCode) {
    PipelineConfig config = make_config(1000, 1);
    config.max_placeholders = 1;
    IdentityTransformer identity;
    TransformPipeline pipeline(config, identity);

    PipelineResult result = pipeline.run("`a` `b` plain");
    ASSERT_TRUE(result.success) << result.error;
    ASSERT_EQ(result.outcomes.size(), 1u);
    EXPECT_TRUE(result.outcomes[0].inline_code_skipped);
    EXPECT_EQ(result.outcomes[0].placeholders, 0u);
    EXPECT_EQ(result.text(), "`a` `b` plain");
}

TEST(TransformPipelineTest, MissingPlaceholderRetriesTransform) {
    ForgetfulOnceTransformer forgetful("__URL_001__");
    TransformPipeline pipeline(make_config(1000, 1), forgetful);
    PipelineResult result = pipeline.run("See [link](https://example.com) now.");

    ASSERT_TRUE(result.success) << result.error;
    ASSERT_EQ(result.outcomes.size(), 1u);
    EXPECT_EQ(forgetful.calls.load(), 2);
    EXPECT_EQ(result.outcomes[0].attempts, 2u);
    EXPECT_EQ(result.outcomes[0].missing_placeholders, 0u);
    EXPECT_EQ(result.text(), "See [link](https://example.com) now.");
    EXPECT_EQ(result.warning_count(), 0u);
}

TEST(TransformPipelineTest, AttemptsStopAtConfiguredLimit) {
    PipelineConfig config = make_config(1000, 1);
    config.placeholder_attempts = 1;
    ForgetfulOnceTransformer forgetful("__URL_001__");
    TransformPipeline pipeline(config, forgetful);
    PipelineResult result = pipeline.run("See [link](https://example.com) now.");

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(forgetful.calls.load(), 1);
    EXPECT_EQ(result.outcomes[0].missing_placeholders, 1u);
    EXPECT_EQ(result.text(), "See [link]() now.");
    EXPECT_GE(result.warning_count(), 1u);
}

TEST(TransformPipelineTest, ReportsFirstFailureInTime) {
    StaggeredFailureTransformer staggered;
    TransformPipeline pipeline(make_config(1000, 2), staggered);
    PipelineResult result = pipeline.run("SLOW\n\n# B\n\nFAIL\n");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failed_chunk_id, "chunk-0002");
    EXPECT_NE(result.error.find("early"), std::string::npos);
}
