#include <gtest/gtest.h>
#include <mdguard/core/preservation.hpp>
#include <mdguard/core/errors.hpp>
#include <mdguard/core/qa_checks.hpp>
#include <string>

using namespace mdguard;

// Test suite for protect/restore

class PreservationTest : public ::testing::Test {
protected:
    static RestorationMap single(const std::string& key, const std::string& value) {
        RestorationMap map;
        map[key] = value;
        return map;
    }

    static RestorationError::Reason restore_failure(const std::string& text, const RestorationMap& map,
                                                    bool strict) {
        try {
            restore(text, map, strict);
        } catch (const RestorationError& e) {
            return e.reason();
        }
        ADD_FAILURE() << "restore did not throw";
        return RestorationError::MALFORMED_RECORD;
    }
};

// ============================================================================
// protect
// ============================================================================

TEST_F(PreservationTest, InlineCodeRoundTrip) {
    std::string text = "`code1` and `code2` and `code3`";
    ProtectedText result = protect(text);

    ASSERT_EQ(result.map.size(), 3u);
    for (RestorationMap::const_iterator it = result.map.begin(); it != result.map.end(); ++it) {
        EXPECT_EQ(it->first.find("__INLINE_CODE_"), 0u) << it->first;
    }
    EXPECT_EQ(restore(result.text, result.map), text);
}

TEST_F(PreservationTest, RightmostSpanGetsLowestNumber) {
    ProtectedText result = protect("`a` `b`");
    EXPECT_EQ(result.text, "__INLINE_CODE_002__ __INLINE_CODE_001__");
    EXPECT_EQ(result.map["__INLINE_CODE_001__"], "`b`");
    EXPECT_EQ(result.map["__INLINE_CODE_002__"], "`a`");
}

TEST_F(PreservationTest, LinkUrlRoundTrip) {
    std::string text = "[link](https://example.com)";
    ProtectedText result = protect(text);
    EXPECT_EQ(result.text, "[link](__URL_001__)");

    std::string restored = restore(result.text, result.map);
    EXPECT_EQ(restored, text);
    EXPECT_NO_THROW(validate_url_targets(text, restored));

    std::string mutated = "[link](https://example.org)";
    EXPECT_THROW(validate_url_targets(text, mutated), UrlTargetMismatch);
}

TEST_F(PreservationTest, FencedCodeBecomesOnePlaceholder) {
    std::string text = "Intro\n```\ncode $x$ `y`\n```\nOutro";
    ProtectedText result = protect(text);
    EXPECT_EQ(result.text, "Intro\n__CODE_BLOCK_001__Outro");
    ASSERT_EQ(result.map.size(), 1u);
    EXPECT_EQ(result.map["__CODE_BLOCK_001__"], "```\ncode $x$ `y`\n```\n");
    EXPECT_EQ(restore(result.text, result.map), text);
}

TEST_F(PreservationTest, EveryKindIsProtected) {
    std::string text = "$$a$$ and $b$ and `c` and <br> and [l](http://u)";
    ProtectedText result = protect(text);
    EXPECT_EQ(result.text,
              "__MATH_BLOCK_001__ and __MATH_INLINE_001__ and __INLINE_CODE_001__ and "
              "__HTML_001__ and [l](__URL_001__)");
    EXPECT_EQ(result.map.size(), 5u);
    EXPECT_EQ(restore(result.text, result.map), text);
}

TEST_F(PreservationTest, DisplayMathKindsShareOneCounter) {
    std::string text = "$$x$$ \\[y\\] \\begin{align}z\\end{align}";
    ProtectedText result = protect(text);
    EXPECT_EQ(result.text, "__MATH_BLOCK_001__ __MATH_BLOCK_002__ __MATH_BLOCK_003__");
    EXPECT_EQ(restore(result.text, result.map), text);
}

TEST_F(PreservationTest, SkipInlineCodeLeavesBackticks) {
    ProtectOptions options;
    options.skip_inline_code = true;
    ProtectedText result = protect("`a` and $x$", options);
    EXPECT_EQ(result.text, "`a` and __MATH_INLINE_001__");
    EXPECT_EQ(result.map.size(), 1u);
}

TEST_F(PreservationTest, ExistingPlaceholderIsRejected) {
    try {
        protect("Existing __CODE_BLOCK_001__ token");
        FAIL() << "expected DetectionError";
    } catch (const DetectionError& e) {
        EXPECT_EQ(e.token(), "__CODE_BLOCK_001__");
        EXPECT_NE(std::string(e.what()).find("__CODE_BLOCK_001__"), std::string::npos);
    }
}

TEST_F(PreservationTest, TooManySpansOfOneKind) {
    std::string text;
    for (int i = 0; i < 1000; ++i) {
        text += "`x` ";
    }
    EXPECT_THROW(protect(text), DetectionError);
}

TEST_F(PreservationTest, SpanCannotSwallowPlaceholderGlued) {
    // Inline code inside a link destination is replaced first; the URL span
    // would then contain its token and is dropped
    std::string text = "[a](http://x`b`)";
    ProtectedText result = protect(text);
    EXPECT_EQ(result.map.size(), 1u);
    EXPECT_EQ(restore(result.text, result.map), text);
}

TEST_F(PreservationTest, TokenGluedToUnderscoreWordStaysUnprotected) {
    const char* documents[] = {
        "__BOLD__`x`",
        "__A$$y$$",
        "}\\__B\\begin{a}\\end{a}_",
        "__X_`code`",
    };
    for (size_t d = 0; d < sizeof(documents) / sizeof(documents[0]); ++d) {
        SCOPED_TRACE(documents[d]);
        ProtectedText result;
        ASSERT_NO_THROW(result = protect(documents[d]));
        EXPECT_TRUE(result.map.empty());
        EXPECT_EQ(result.text, documents[d]);
        EXPECT_EQ(restore(result.text, result.map), documents[d]);
    }
}

TEST_F(PreservationTest, OnlyTheGluedSpanIsDropped) {
    std::string text = "__BOLD__`x` and `y`";
    ProtectedText result = protect(text);
    EXPECT_EQ(result.text, "__BOLD__`x` and __INLINE_CODE_001__");
    ASSERT_EQ(result.map.size(), 1u);
    EXPECT_EQ(result.map["__INLINE_CODE_001__"], "`y`");
    EXPECT_EQ(restore(result.text, result.map), text);
}

TEST_F(PreservationTest, RoundTripOnMixedDocuments) {
    const char* documents[] = {
        "",
        "plain text only",
        "# Title\n\n```python\nprint('$5')\n```\n\nCosts $5 and $10.\n",
        "Euler: $e^{i\\pi} + 1 = 0$, display:\n$$\n\\int_0^1 x\\,dx\n$$\n",
        "Refs [a][1] and [b](<http://b c> \"t\").\n\n[1]: https://one.example\n",
        "<!-- comment --><span class=\"k\">kw</span> `a<b>` \\(x\\) \\[y\\]",
        "Unclosed `tick and $dollar and \\(paren",
        "```\nunterminated fence\n$$ still code",
        "![img](a.png) [![nested](b.png)](http://c)",
    };
    for (size_t d = 0; d < sizeof(documents) / sizeof(documents[0]); ++d) {
        SCOPED_TRACE(documents[d]);
        ProtectedText result = protect(documents[d]);
        EXPECT_NO_THROW(validate_restoration(result.text, result.map));
        EXPECT_EQ(restore(result.text, result.map), documents[d]);
    }
}

// ============================================================================
// restore / validate_restoration
// ============================================================================

TEST_F(PreservationTest, InvalidKeyRejectedBeforeSubstitution) {
    RestorationMap map;
    map["invalid_key"] = "x";
    map["__URL_001__"] = "http://u";
    try {
        restore("see __URL_001__", map);
        FAIL() << "expected RestorationError";
    } catch (const RestorationError& e) {
        EXPECT_EQ(e.reason(), RestorationError::INVALID_FORMAT);
        EXPECT_EQ(e.token(), "invalid_key");
    }
}

TEST_F(PreservationTest, StrictRestoreReasons) {
    EXPECT_EQ(restore_failure("no tokens", single("__URL_001__", "u"), true), RestorationError::MISSING);
    EXPECT_EQ(restore_failure("__URL_001__ __URL_001__", single("__URL_001__", "u"), true),
              RestorationError::DUPLICATED);
    EXPECT_EQ(restore_failure("__URL_001__ __URL_002__", single("__URL_001__", "u"), true),
              RestorationError::UNKNOWN);
}

TEST_F(PreservationTest, ValidateNamesTheToken) {
    try {
        validate_restoration("__URL_001__ __HTML_004__", single("__URL_001__", "u"));
        FAIL() << "expected RestorationError";
    } catch (const RestorationError& e) {
        EXPECT_EQ(e.reason(), RestorationError::UNKNOWN);
        EXPECT_EQ(e.token(), "__HTML_004__");
    }
}

TEST_F(PreservationTest, NonStrictSkipsMissingKeys) {
    EXPECT_EQ(restore("plain", single("__URL_001__", "u"), false), "plain");

    RestorationMap map = single("__URL_001__", "http://u");
    map["__HTML_001__"] = "<br>";
    EXPECT_EQ(restore("[a](__URL_001__)", map, false), "[a](http://u)");
}

TEST_F(PreservationTest, NonStrictReplacesDuplicates) {
    EXPECT_EQ(restore("__URL_001__ __URL_001__", single("__URL_001__", "u"), false), "u u");
}

TEST_F(PreservationTest, LeftoverPlaceholderIsAnError) {
    EXPECT_EQ(restore_failure("a __HTML_009__", single("__URL_001__", "u"), false),
              RestorationError::LEFTOVER);
}

TEST_F(PreservationTest, RestoredValuesAreNotRescanned) {
    RestorationMap map = single("__URL_001__", "literal __ text");
    map["__URL_002__"] = "b";
    EXPECT_EQ(restore("__URL_001__ __URL_002__", map), "literal __ text b");
}

TEST_F(PreservationTest, EmptyMapRestoresUnchanged) {
    EXPECT_EQ(restore("nothing here", RestorationMap()), "nothing here");
}

TEST_F(PreservationTest, StripUnknownPlaceholders) {
    RestorationMap map = single("__URL_001__", "u");
    EXPECT_EQ(strip_unknown_placeholders("x __URL_001__ y __URL_002__", map), "x __URL_001__ y ");
    EXPECT_EQ(strip_unknown_placeholders("clean", map), "clean");
}

// ============================================================================
// Records
// ============================================================================

TEST_F(PreservationTest, MapJsonRoundTrip) {
    ProtectedText result = protect("`a` [b](http://c)");
    Json record = restoration_map_to_json(result.map);
    ASSERT_TRUE(record.is_object());
    EXPECT_EQ(record.size(), 2u);
    EXPECT_EQ(restoration_map_from_json(record), result.map);
}

TEST_F(PreservationTest, MalformedMapRecord) {
    try {
        restoration_map_from_json(Json::array());
        FAIL() << "expected RestorationError";
    } catch (const RestorationError& e) {
        EXPECT_EQ(e.reason(), RestorationError::MALFORMED_RECORD);
    }

    Json record = Json::object();
    record["__URL_001__"] = 42;
    EXPECT_THROW(restoration_map_from_json(record), RestorationError);
}
