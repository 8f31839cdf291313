/**
 * @file test_patch.cpp
 * @brief Unit tests for replace / insert / remove (GoogleTest)
 */

#include <gtest/gtest.h>
#include "jpatch/Patch.hpp"
#include "jpatch/Scanner.hpp"

using namespace jpatch;

namespace {
    /**
     * @brief Locate @p key and remove it
     */
    std::string remove_key(const std::string& doc, const std::string& key) {
        auto loc = locate_key(doc, key);
        EXPECT_TRUE(loc.has_value()) << "key not found: " << key;
        if (!loc) return doc;
        auto end = scan_value_end(doc, loc->value_start);
        EXPECT_TRUE(end.has_value());
        if (!end) return doc;
        return apply_remove(doc,
                            ByteRange{loc->key_start, loc->value_start},
                            ByteRange{loc->value_start, *end});
    }
}

// ============================================================================
// apply_replace
// ============================================================================

TEST(ApplyReplace, SplicesValueOnly) {
    std::string doc = "{\n  // c\n  \"k\": [1],\n  \"b\": 2\n}";
    auto start = doc.find('[');
    auto out = apply_replace(doc, ByteRange{start, start + 3}, "[]");
    EXPECT_EQ(out, "{\n  // c\n  \"k\": [],\n  \"b\": 2\n}");
}

TEST(ApplyReplace, EmptyRangeInserts) {
    EXPECT_EQ(apply_replace("ab", ByteRange{1, 1}, "X"), "aXb");
}

// ============================================================================
// apply_insert
// ============================================================================

TEST(ApplyInsert, SingleLineObject) {
    EXPECT_EQ(apply_insert("{\"a\":1}", "k", "[]", "    "),
              "{\"a\":1,\n    \"k\": []\n}");
}

TEST(ApplyInsert, MultiLineObject) {
    EXPECT_EQ(apply_insert("{\n    \"a\": 1\n}", "k", "[]", "    "),
              "{\n    \"a\": 1,\n    \"k\": []\n}");
}

TEST(ApplyInsert, AlreadyCommaTerminated) {
    EXPECT_EQ(apply_insert("{\n    \"a\": 1,\n}", "k", "[]", "    "),
              "{\n    \"a\": 1,\n    \"k\": []\n}");
}

TEST(ApplyInsert, EmptyObject) {
    EXPECT_EQ(apply_insert("{}", "k", "[]", "    "), "{\n    \"k\": []\n}");
    EXPECT_EQ(apply_insert("{\n}", "k", "[]", "    "), "{\n    \"k\": []\n}");
}

TEST(ApplyInsert, CommaGoesBeforeTrailingComment) {
    EXPECT_EQ(apply_insert("{\n    \"a\": 1 // note\n}", "k", "[]", "    "),
              "{\n    \"a\": 1, // note\n    \"k\": []\n}");
}

TEST(ApplyInsert, IgnoresBraceAfterRootObject) {
    EXPECT_EQ(apply_insert("{\"a\":1}\n// }\n", "k", "2", "  "),
              "{\"a\":1,\n  \"k\": 2\n}\n// }\n");
}

TEST(ApplyInsert, CrLf) {
    EXPECT_EQ(apply_insert("{\r\n  \"a\": 1\r\n}", "k", "[]", "  ", "\r\n"),
              "{\r\n  \"a\": 1,\r\n  \"k\": []\r\n}");
}

TEST(ApplyInsert, EscapesKey) {
    EXPECT_EQ(apply_insert("{}", "a\"b", "1", "  "), "{\n  \"a\\\"b\": 1\n}");
}

TEST(ApplyInsert, EmptyDocumentSynthesizesObject) {
    EXPECT_EQ(apply_insert("", "k", "[]", "    "), "{\n    \"k\": []\n}\n");
    EXPECT_EQ(apply_insert("  \n", "k", "[]", "    "), "{\n    \"k\": []\n}\n");
}

TEST(ApplyInsert, NoClosingBraceSynthesizesObject) {
    EXPECT_EQ(apply_insert("{\"a\": 1", "k", "1", "  "), "{\n  \"k\": 1\n}\n");
    EXPECT_EQ(apply_insert("garbage", "k", "1", "  "), "{\n  \"k\": 1\n}\n");
}

// ============================================================================
// apply_remove
// ============================================================================

TEST(ApplyRemove, FirstOfSeveralLines) {
    EXPECT_EQ(remove_key("{\n  \"k\": [1],\n  \"b\": 2\n}", "k"),
              "{\n  \"b\": 2\n}");
}

TEST(ApplyRemove, MiddleLine) {
    EXPECT_EQ(remove_key("{\n  \"a\": 1,\n  \"k\": 2,\n  \"b\": 3\n}", "k"),
              "{\n  \"a\": 1,\n  \"b\": 3\n}");
}

TEST(ApplyRemove, LastLineStripsDanglingComma) {
    EXPECT_EQ(remove_key("{\n  \"a\": 1,\n  \"k\": 2\n}", "k"),
              "{\n  \"a\": 1\n}");
}

TEST(ApplyRemove, LastMemberWithBraceOnSameLine) {
    EXPECT_EQ(remove_key("{\n  \"a\": 1,\n  \"k\": 2}", "k"),
              "{\n  \"a\": 1\n}");
}

TEST(ApplyRemove, OnlyMemberSingleLine) {
    EXPECT_EQ(remove_key("{\"k\": [{\"name\":\"FOO\",\"value\":\"bar\"}]}", "k"), "{}");
}

TEST(ApplyRemove, OnlyMemberMultiLine) {
    EXPECT_EQ(remove_key("{\n  \"k\": [\n    1\n  ]\n}", "k"), "{\n}");
}

TEST(ApplyRemove, SingleLineMiddle) {
    EXPECT_EQ(remove_key("{\"a\":1, \"k\":2, \"b\":3}", "k"), "{\"a\":1, \"b\":3}");
}

TEST(ApplyRemove, SingleLineLast) {
    EXPECT_EQ(remove_key("{\"a\":1, \"k\":2}", "k"), "{\"a\":1}");
}

TEST(ApplyRemove, SingleLineFirst) {
    EXPECT_EQ(remove_key("{\"k\":2, \"a\":1}", "k"), "{\"a\":1}");
}

TEST(ApplyRemove, KeepsTrailingLineComment) {
    EXPECT_EQ(remove_key("{\n  \"k\": 2, // about k\n  \"b\": 3\n}", "k"),
              "{\n  // about k\n  \"b\": 3\n}");
}

TEST(ApplyRemove, KeepsTrailingLineCommentOnLastMember) {
    EXPECT_EQ(remove_key("{\n  \"a\": 1,\n  \"k\": 2 // about k\n}", "k"),
              "{\n  \"a\": 1\n  // about k\n}");
}

TEST(ApplyRemove, BlockCommentBeforeComma) {
    EXPECT_EQ(remove_key("{\n  \"a\": 1,\n  \"k\": 2 /* keep me */,\n  \"b\": 3\n}", "k"),
              "{\n  \"a\": 1,\n  /* keep me */\n  \"b\": 3\n}");
}

TEST(ApplyRemove, BlockCommentBeforeCommaSingleLine) {
    EXPECT_EQ(remove_key("{\"a\":1, \"k\":2 /* c */, \"b\":3}", "k"),
              "{\"a\":1, /* c */ \"b\":3}");
}

TEST(ApplyRemove, LineCommentBeforeCommaDoesNotHideNextMember) {
    EXPECT_EQ(remove_key("{\n  \"k\": 2 // c\n  , \"b\": 3\n}", "k"),
              "{\n  // c\n  \"b\": 3\n}");
}

TEST(ApplyRemove, KeepsCommentOnPrecedingLine) {
    EXPECT_EQ(remove_key("{\n  // keep\n  \"a\": 1,\n  \"k\": 2\n}", "k"),
              "{\n  // keep\n  \"a\": 1\n}");
}

TEST(ApplyRemove, DanglingCommaBeforeComment) {
    EXPECT_EQ(remove_key("{\n  \"a\": 1, // a\n  \"k\": 2\n}", "k"),
              "{\n  \"a\": 1 // a\n}");
}

TEST(ApplyRemove, CrLf) {
    EXPECT_EQ(remove_key("{\r\n  \"a\": 1,\r\n  \"k\": 2\r\n}", "k"),
              "{\r\n  \"a\": 1\r\n}");
}

TEST(ApplyRemove, MultiLineValue) {
    std::string doc =
        "{\n"
        "  \"a\": 1,\n"
        "  \"k\": [\n"
        "    { \"name\": \"X\", \"value\": \"]\" }\n"
        "  ],\n"
        "  \"b\": 2\n"
        "}";
    EXPECT_EQ(remove_key(doc, "k"), "{\n  \"a\": 1,\n  \"b\": 2\n}");
}

// ============================================================================
// synthesize_document
// ============================================================================

TEST(SynthesizeDocument, MinimalObject) {
    EXPECT_EQ(synthesize_document("k", "[]", "  "), "{\n  \"k\": []\n}\n");
}
