#ifndef DOCSANITIZER_TEST_UNIT_TEST_CHUNKER_HPP
#define DOCSANITIZER_TEST_UNIT_TEST_CHUNKER_HPP

// test/unit/test_chunker.hpp
// -----------------------------------------------------------
// Greedy packing of document units into size-bounded chunks.

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "chunk/chunker.hpp"
#include "extract/text_codec.hpp"

namespace {

using docsanitizer::chunk::Chunk;
using docsanitizer::chunk::Chunker;
using docsanitizer::extract::ExtractedDocument;
using docsanitizer::extract::Segment;
using docsanitizer::extract::SegmentKind;

ExtractedDocument documentOf(const std::vector<std::pair<std::string, std::vector<std::string>>> &segments)
{
    ExtractedDocument doc;
    for (const auto &s : segments) {
        Segment segment;
        segment.kind = SegmentKind::Body;
        segment.label = s.first;
        segment.units = s.second;
        doc.segments.push_back(segment);
    }
    return doc;
}

std::string reassemble(const std::vector<Chunk> &chunks)
{
    std::string out;
    for (const auto &chunk : chunks) {
        out += chunk.text;
        out += chunk.separatorAfter;
    }
    return out;
}

ExtractedDocument mixedDocument()
{
    return documentOf({
        {"Body",
         {"# Incident report", "Reported by Jane Doe (jane@example.com) on 2024-03-01.", "",
          "Caf\xC3\xA9 manager Ren\xC3\xA9 called +1 555 0100 twice.",
          "Averyveryveryverylongtokenwithoutanyspacesatallthatkeepsgoing"}},
        {"Table 1", {"| Name | Phone |", "|---|---|", "| Jane Doe | 555-0100 |"}},
        {"Empty", {}},
        {"Footer", {"\xE2\x82\xAC 1,200 paid  ", "end"}},
    });
}

TEST(ChunkerTest, ReassemblyIsExactForEveryLimit) {
    ExtractedDocument doc = mixedDocument();
    const std::string expected = doc.text();
    for (size_t limit = 1; limit <= 80; ++limit) {
        Chunker chunker(limit);
        auto chunks = chunker.split(doc);
        ASSERT_FALSE(chunks.empty());
        EXPECT_EQ(reassemble(chunks), expected) << "limit " << limit;
        EXPECT_TRUE(chunks.back().separatorAfter.empty());
        for (const auto &chunk : chunks) {
            EXPECT_EQ(chunk.size, chunk.text.size());
            // Only a single code point wider than the limit may overflow it.
            if (limit >= 4) {
                EXPECT_LE(chunk.size, limit) << "limit " << limit;
            }
            EXPECT_TRUE(docsanitizer::extract::codec::isValidUtf8(chunk.text)) << "limit " << limit;
        }
    }
}

TEST(ChunkerTest, OrdinalsAreOneBasedAndContiguous) {
    Chunker chunker(20);
    auto chunks = chunker.split(mixedDocument());
    ASSERT_GT(chunks.size(), (size_t)3);
    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].ordinal, i + 1);
    }
}

TEST(ChunkerTest, UnitsThatFitAreNeverSplit) {
    const std::string a(10, 'a');
    const std::string b(10, 'b');
    const std::string c(10, 'c');
    ExtractedDocument doc = documentOf({{"Body", {a, b, c}}});

    Chunker chunker(25);
    auto chunks = chunker.split(doc);
    ASSERT_EQ(chunks.size(), (size_t)2);
    EXPECT_EQ(chunks[0].text, a + "\n" + b);
    EXPECT_EQ(chunks[0].separatorAfter, "\n");
    EXPECT_EQ(chunks[1].text, c);
    EXPECT_EQ(chunks[1].separatorAfter, "");
}

TEST(ChunkerTest, DocumentWithinLimitIsOneChunk) {
    ExtractedDocument doc = documentOf({{"Body", {"short", "text"}}});
    Chunker chunker(6000);
    auto chunks = chunker.split(doc);
    ASSERT_EQ(chunks.size(), (size_t)1);
    EXPECT_EQ(chunks[0].text, "short\ntext");
    EXPECT_EQ(chunks[0].ordinal, (size_t)1);
}

TEST(ChunkerTest, OverlongUnitSplitsAtWhitespace) {
    ExtractedDocument doc = documentOf({{"Body", {"alpha beta gamma delta"}}});
    Chunker chunker(11);
    auto chunks = chunker.split(doc);
    ASSERT_EQ(chunks.size(), (size_t)2);
    EXPECT_EQ(chunks[0].text, "alpha beta");
    EXPECT_EQ(chunks[0].separatorAfter, " ");
    EXPECT_EQ(chunks[1].text, "gamma delta");
}

TEST(ChunkerTest, HardCutRespectsCodePointBoundaries) {
    // Five two-byte code points, no whitespace.
    const std::string word = "\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9";
    ExtractedDocument doc = documentOf({{"Body", {word}}});

    Chunker chunker(3);
    auto chunks = chunker.split(doc);
    ASSERT_EQ(chunks.size(), (size_t)5);
    for (const auto &chunk : chunks) {
        EXPECT_EQ(chunk.text, "\xC3\xA9");
    }
    EXPECT_EQ(reassemble(chunks), word);

    // A limit below one code point still makes progress.
    Chunker tiny(1);
    auto tinyChunks = tiny.split(doc);
    ASSERT_EQ(tinyChunks.size(), (size_t)5);
    EXPECT_EQ(tinyChunks[0].size, (size_t)2);
}

TEST(ChunkerTest, ContextIsLabelOfStartingSegment) {
    ExtractedDocument doc = documentOf({{"Staff", {"| a |", "| b |"}}, {"Contractors", {"| c |"}}});
    Chunker chunker(12);
    auto chunks = chunker.split(doc);
    ASSERT_EQ(chunks.size(), (size_t)2);
    EXPECT_EQ(chunks[0].text, "| a |\n| b |");
    EXPECT_EQ(chunks[0].context, "Staff");
    EXPECT_EQ(chunks[0].separatorAfter, "\n\n");
    EXPECT_EQ(chunks[1].context, "Contractors");
}

TEST(ChunkerTest, EmptyDocumentsYieldNoChunks) {
    Chunker chunker(100);
    EXPECT_TRUE(chunker.split(ExtractedDocument()).empty());
    EXPECT_TRUE(chunker.split(documentOf({{"Body", {"", "  ", "\t"}}, {"Other", {}}})).empty());
}

TEST(ChunkerTest, OutputDependsOnInputAlone) {
    Chunker chunker(17);
    auto first = chunker.split(mixedDocument());
    auto second = chunker.split(mixedDocument());
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].text, second[i].text);
        EXPECT_EQ(first[i].separatorAfter, second[i].separatorAfter);
    }
}

TEST(ChunkerTest, ZeroLimitIsRejected) {
    EXPECT_THROW(Chunker(0), std::invalid_argument);
}

} // anonymous namespace

#endif // DOCSANITIZER_TEST_UNIT_TEST_CHUNKER_HPP
