#include <gtest/gtest.h>
#include <kara/document.hpp>
#include <set>
#include <string>

using namespace kara;

namespace
{

const char* DEMO_DOCUMENT =
    "City of stars\n"
    "You never shined so brightly\n"
    "[//]\n"
    "[lbl][0.000/3.420,3.920/11.032]\n"
    "[lsk][(0.000/0.000,1.200/0.700,3.420/1.000),"
    "(0.000/0.000,0.400/0.200,5.400/0.900,7.000/1.000)]";

}   // namespace

// ─── Encoding ────────────────────────────────────────────────────────────────

TEST(DocumentCodec, EncodesDemo)
{
    EXPECT_EQ(encode_document(AnimationData::demo()), DEMO_DOCUMENT);
}

TEST(DocumentCodec, EncodesPartLabels)
{
    AnimationData data;
    data.add_line("one", 0.0f, 1.0f);
    data.add_line("two", 1.0f, 2.0f).part = "Chorus";

    std::string doc = encode_document(data);
    EXPECT_EQ(doc.substr(0, doc.find("[//]")), "one\n\n[Chorus]\ntwo\n");
}

TEST(DocumentCodec, EncodeStripsReservedCharacters)
{
    AnimationData data;
    data.add_line("a/b [c]", 0.0f, 1.0f);

    std::string doc = encode_document(data);
    EXPECT_EQ(doc.substr(0, doc.find('\n')), "ab c");
}

TEST(DocumentCodec, SanitizeText)
{
    EXPECT_EQ(sanitize_text("a/b[c]\td"), "abcd");
    EXPECT_EQ(sanitize_text("caf\xC3\xA9"), "caf\xC3\xA9");
    EXPECT_EQ(sanitize_text(""), "");
}

// ─── Decoding ────────────────────────────────────────────────────────────────

TEST(DocumentCodec, DecodesDemo)
{
    DecodeResult result = decode_document(DEMO_DOCUMENT);
    ASSERT_TRUE(result.ok()) << result.message;

    const auto& lines = result.data.lines;
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].text, "City of stars");
    EXPECT_NEAR(lines[1].start, 3.92f, 1e-4f);
    EXPECT_NEAR(lines[1].end, 11.032f, 1e-4f);
    ASSERT_EQ(lines[0].keyframes.size(), 3u);
    EXPECT_NEAR(lines[0].keyframes[1].index, 9.1f, 1e-3f);
    EXPECT_NEAR(lines[0].get_current_index(1.2f), 9.1f, 1e-3f);
}

TEST(DocumentCodec, RoundTripPreservesModel)
{
    AnimationData original = AnimationData::demo();
    original.lines[1].part = "Verse";

    DecodeResult result = decode_document(encode_document(original));
    ASSERT_TRUE(result.ok()) << result.message;
    ASSERT_EQ(result.data.lines.size(), original.lines.size());

    for (size_t i = 0; i < original.lines.size(); ++i)
    {
        const auto& a = original.lines[i];
        const auto& b = result.data.lines[i];
        EXPECT_EQ(a.text, b.text);
        EXPECT_EQ(a.part, b.part);
        EXPECT_NEAR(a.start, b.start, 1e-3f);
        EXPECT_NEAR(a.end, b.end, 1e-3f);
        ASSERT_EQ(a.keyframes.size(), b.keyframes.size());
        for (size_t k = 0; k < a.keyframes.size(); ++k)
        {
            EXPECT_NEAR(a.keyframes[k].time, b.keyframes[k].time, 1e-3f);
            EXPECT_NEAR(a.keyframes[k].index, b.keyframes[k].index, 0.05f);
        }
    }
}

TEST(DocumentCodec, PartLabelIsSticky)
{
    const char* doc =
        "intro\n"
        "\n"
        "[Chorus]\n"
        "first\n"
        "second\n"
        "[//]\n"
        "[lbl][0/1,1/2,2/3]\n"
        "[lsk][(),(),()]";

    DecodeResult result = decode_document(doc);
    ASSERT_TRUE(result.ok()) << result.message;
    ASSERT_EQ(result.data.lines.size(), 3u);
    EXPECT_FALSE(result.data.lines[0].part.has_value());
    EXPECT_EQ(result.data.lines[1].part, "Chorus");
    EXPECT_EQ(result.data.lines[2].part, "Chorus");
}

TEST(DocumentCodec, TrimsTextLines)
{
    DecodeResult result = decode_document("  hello  \n[//]\n[lbl][0/1]\n[lsk][(0/0)]");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.data.lines[0].text, "hello");
}

TEST(DocumentCodec, UnparsableNumbersReadAsZero)
{
    DecodeResult result = decode_document("ab\n[//]\n[lbl][x/2.5]\n[lsk][(abc/0.5)]");
    ASSERT_TRUE(result.ok()) << result.message;

    const auto& line = result.data.lines[0];
    EXPECT_FLOAT_EQ(line.start, 0.0f);
    EXPECT_FLOAT_EQ(line.end, 2.5f);
    ASSERT_EQ(line.keyframes.size(), 1u);
    EXPECT_FLOAT_EQ(line.keyframes[0].time, 0.0f);
    EXPECT_FLOAT_EQ(line.keyframes[0].index, 1.0f);
}

TEST(DocumentCodec, EntryWithoutSlashIsSkipped)
{
    DecodeResult result = decode_document("ab\n[//]\n[lbl][0/1]\n[lsk][(1.0,0.5/1)]");
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.data.lines[0].keyframes.size(), 1u);
    EXPECT_FLOAT_EQ(result.data.lines[0].keyframes[0].time, 0.5f);
}

TEST(DocumentCodec, DecodedKeyframesAreSorted)
{
    DecodeResult result = decode_document("abcd\n[//]\n[lbl][0/2]\n[lsk][(2/1,1/0.5,0/0)]");
    ASSERT_TRUE(result.ok());

    const auto& kfs = result.data.lines[0].keyframes;
    ASSERT_EQ(kfs.size(), 3u);
    EXPECT_FLOAT_EQ(kfs[0].time, 0.0f);
    EXPECT_FLOAT_EQ(kfs[1].time, 1.0f);
    EXPECT_FLOAT_EQ(kfs[1].index, 2.0f);
    EXPECT_FLOAT_EQ(kfs[2].time, 2.0f);
}

TEST(DocumentCodec, MissingKeyframeGroupsLeaveLinesEmpty)
{
    DecodeResult result = decode_document("a\nb\n[//]\n[lbl][0/1,1/2]\n[lsk][(0/0)]");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.data.lines[0].keyframes.size(), 1u);
    EXPECT_TRUE(result.data.lines[1].keyframes.empty());
}

// ─── Errors ──────────────────────────────────────────────────────────────────

TEST(DocumentCodec, MissingSeparator)
{
    DecodeResult result = decode_document("hello\n[lbl][0/1]\n[lsk][(0/0)]");
    EXPECT_EQ(result.error, DecodeError::MissingSeparator);
    EXPECT_EQ(result.message, "Missing [//] separator");
    EXPECT_TRUE(result.data.lines.empty());
}

TEST(DocumentCodec, MissingTimestampMarker)
{
    DecodeResult result = decode_document("a\n[//]\n[lsk][(0/0)]");
    EXPECT_EQ(result.error, DecodeError::MissingMarker);
    EXPECT_EQ(result.message, "Missing [lbl]");
}

TEST(DocumentCodec, MissingKeyframeMarker)
{
    DecodeResult result = decode_document("a\n[//]\n[lbl][0/1]");
    EXPECT_EQ(result.error, DecodeError::MissingMarker);
    EXPECT_EQ(result.message, "Missing [lsk]");
}

TEST(DocumentCodec, MissingOpenBracket)
{
    DecodeResult result = decode_document("a\n[//]\n[lbl][0/1]\n[lsk]");
    EXPECT_EQ(result.error, DecodeError::MissingOpenBracket);
    EXPECT_EQ(result.message, "Missing [ after [lsk]");
}

TEST(DocumentCodec, MissingCloseBracket)
{
    DecodeResult result = decode_document("a\n[//]\n[lbl][0/1");
    EXPECT_EQ(result.error, DecodeError::MissingCloseBracket);
    EXPECT_EQ(result.message, "Missing ] after [lbl]");
}

TEST(DocumentCodec, LineCountMismatch)
{
    DecodeResult result = decode_document("a\nb\n[//]\n[lbl][0/1]\n[lsk][(0/0)]");
    EXPECT_EQ(result.error, DecodeError::LineCountMismatch);
    EXPECT_EQ(result.message, "Line count mismatch with timestamps: 2 lines, 1 timestamps");
    EXPECT_TRUE(result.data.lines.empty());
}

TEST(DocumentCodec, EmptyModelDoesNotDecode)
{
    DecodeResult result = decode_document(encode_document(AnimationData{}));
    EXPECT_EQ(result.error, DecodeError::LineCountMismatch);
}

TEST(DocumentCodec, ErrorNamesAreDistinct)
{
    std::set<std::string> names;
    for (DecodeError e : {DecodeError::None,
                          DecodeError::MissingSeparator,
                          DecodeError::MissingMarker,
                          DecodeError::MissingOpenBracket,
                          DecodeError::MissingCloseBracket,
                          DecodeError::LineCountMismatch})
    {
        names.insert(decode_error_name(e));
    }
    EXPECT_EQ(names.size(), 6u);
}
