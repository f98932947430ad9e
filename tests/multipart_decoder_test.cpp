#include <gtest/gtest.h>

#include "fakes.h"
#include "net/MultipartDecoder.h"

namespace {
const std::string kType = "multipart/mixed; boundary=B";

std::string sizedPart(const std::string& id, const std::string& name, const std::string& bytes, bool first) {
    return std::string(first ? "" : "\r\n") + "--B\r\n"
        "Content-Type: application/pdf\r\n"
        "X-Display-Name: " + name + "\r\n"
        "X-Record-Id: " + id + "\r\n"
        "Content-Length: " + std::to_string(bytes.size()) + "\r\n"
        "\r\n" + bytes;
}

MultipartDecoder::Result decodeText(const std::string& body) {
    return MultipartDecoder::decode(kType, body.data(), body.size());
}
}

TEST(MultipartDecoderTest, BoundaryFromContentType) {
    EXPECT_EQ(MultipartDecoder::boundaryFromContentType("multipart/mixed; boundary=abc"), "abc");
    EXPECT_EQ(MultipartDecoder::boundaryFromContentType("multipart/mixed; boundary=\"a b\""), "a b");
    EXPECT_EQ(MultipartDecoder::boundaryFromContentType("Multipart/Mixed; charset=x; Boundary=----PDFBoundary1"),
        "----PDFBoundary1");
}

TEST(MultipartDecoderTest, MissingBoundaryIsProtocolError) {
    EXPECT_THROW(MultipartDecoder::boundaryFromContentType("multipart/mixed"), ProtocolError);
    EXPECT_THROW(MultipartDecoder::boundaryFromContentType("multipart/mixed; boundary="), ProtocolError);
    EXPECT_THROW(MultipartDecoder::boundaryFromContentType("application/json"), ProtocolError);

    const std::string body = "{}";
    EXPECT_THROW(MultipartDecoder::decode("application/json", body.data(), body.size()), ProtocolError);
}

TEST(MultipartDecoderTest, DecodesPartsInBodyOrder) {
    const std::string body = sizedPart("a", "Ram", "%PDF-a", true)
        + sizedPart("b", "Shyam", "%PDF-bb", false)
        + "\r\n--B--\r\n";

    const auto result = decodeText(body);
    EXPECT_TRUE(result.terminated);
    EXPECT_TRUE(result.diagnostics.empty());
    ASSERT_EQ(result.parts.size(), 2u);
    EXPECT_EQ(result.parts[0].id, "a");
    EXPECT_EQ(result.parts[0].displayName, "Ram");
    EXPECT_EQ(asString(result.parts[0].bytes), "%PDF-a");
    EXPECT_EQ(result.parts[1].id, "b");
    EXPECT_EQ(result.parts[1].displayName, "Shyam");
    EXPECT_EQ(asString(result.parts[1].bytes), "%PDF-bb");
}

TEST(MultipartDecoderTest, ByteAtATimeFeedingGivesSameParts) {
    const std::string body = "preamble\r\n" + sizedPart("a", "Ram", "first document", true)
        + sizedPart("b", "Shyam", "second", false)
        + "\r\n--B--\r\nepilogue";

    std::vector<DecodedPart> parts;
    MultipartDecoder decoder("B", [&](DecodedPart&& part) {
        parts.push_back(std::move(part));
        });

    for (char c : body)
        decoder.feed(&c, 1);
    decoder.finish();

    EXPECT_TRUE(decoder.terminated());
    EXPECT_EQ(decoder.partsDecoded(), 2u);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(asString(parts[0].bytes), "first document");
    EXPECT_EQ(asString(parts[1].bytes), "second");
}

TEST(MultipartDecoderTest, PartIsHandedOnBeforeTheStreamEnds) {
    std::vector<DecodedPart> parts;
    MultipartDecoder decoder("B", [&](DecodedPart&& part) {
        parts.push_back(std::move(part));
        });

    const std::string first = sizedPart("a", "Ram", "AAAA", true);
    decoder.feed(first.data(), first.size());
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].id, "a");
    EXPECT_FALSE(decoder.terminated());
}

TEST(MultipartDecoderTest, BinaryBodyMayContainTheBoundary) {
    std::string binary = "%PDF\r\n--B\r\nX-Record-Id: fake\r\n\r\n";
    binary.push_back('\0');
    binary.push_back('\xFF');

    const std::string body = sizedPart("a", "Ram", binary, true) + "\r\n--B--\r\n";
    const auto result = decodeText(body);

    ASSERT_EQ(result.parts.size(), 1u);
    EXPECT_EQ(asString(result.parts[0].bytes), binary);
    EXPECT_TRUE(result.terminated);
}

TEST(MultipartDecoderTest, BodyWithoutContentLengthEndsAtNextDelimiter) {
    const std::string body =
        "--B\r\nX-Record-Id: a\r\n\r\nhello\r\n"
        "--B\r\nX-Record-Id: b\r\n\r\nline\n\r\n"
        "--B--\r\n";

    const auto result = decodeText(body);
    ASSERT_EQ(result.parts.size(), 2u);
    EXPECT_EQ(asString(result.parts[0].bytes), "hello");
    // Only the line break that belongs to the delimiter is removed
    EXPECT_EQ(asString(result.parts[1].bytes), "line\n");
    EXPECT_TRUE(result.terminated);
}

TEST(MultipartDecoderTest, HeaderKeysAreCaseInsensitive) {
    const std::string body =
        "--B\r\ncontent-length: 3\r\nx-display-name: Ram%20Kumar\r\nX-RECORD-ID: a%2F1\r\nx-index: 4\r\n\r\nabc"
        "\r\n--B--\r\n";

    const auto result = decodeText(body);
    ASSERT_EQ(result.parts.size(), 1u);
    EXPECT_EQ(result.parts[0].displayName, "Ram Kumar");
    EXPECT_EQ(result.parts[0].id, "a/1");
    EXPECT_EQ(result.parts[0].index, 4u);
    EXPECT_EQ(asString(result.parts[0].bytes), "abc");
}

TEST(MultipartDecoderTest, NameFallsBackToAttachmentFilename) {
    const std::string body =
        "--B\r\nContent-Disposition: attachment; filename=\"Shyam%20S.pdf\"\r\nContent-Length: 2\r\n\r\nzz"
        "\r\n--B--\r\n";

    const auto result = decodeText(body);
    ASSERT_EQ(result.parts.size(), 1u);
    EXPECT_EQ(result.parts[0].displayName, "Shyam S");
    EXPECT_EQ(result.parts[0].index, 0u);
}

TEST(MultipartDecoderTest, MalformedPartIsDroppedOthersSurvive) {
    const std::string body = sizedPart("a", "Ram", "AAA", true)
        + "\r\n--B\r\nthis is not a header\r\nContent-Length: 3\r\n\r\nBBB"
        + sizedPart("c", "Chen", "CCC", false)
        + "\r\n--B--\r\n";

    const auto result = decodeText(body);
    ASSERT_EQ(result.parts.size(), 2u);
    EXPECT_EQ(result.parts[0].id, "a");
    EXPECT_EQ(result.parts[1].id, "c");
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_NE(result.diagnostics[0].find("part 1 dropped"), std::string::npos);
    EXPECT_TRUE(result.terminated);
}

TEST(MultipartDecoderTest, EmptyBodyIsDropped) {
    const std::string body = sizedPart("a", "Ram", "", true)
        + sizedPart("b", "Shyam", "B", false)
        + "\r\n--B--\r\n";

    const auto result = decodeText(body);
    ASSERT_EQ(result.parts.size(), 1u);
    EXPECT_EQ(result.parts[0].id, "b");
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_NE(result.diagnostics[0].find("empty body"), std::string::npos);
}

TEST(MultipartDecoderTest, InvalidContentLengthIsDropped) {
    const std::string body =
        "--B\r\nX-Record-Id: a\r\nContent-Length: twelve\r\n\r\nxx"
        + sizedPart("b", "Shyam", "B", false)
        + "\r\n--B--\r\n";

    const auto result = decodeText(body);
    ASSERT_EQ(result.parts.size(), 1u);
    EXPECT_EQ(result.parts[0].id, "b");
    ASSERT_FALSE(result.diagnostics.empty());
    EXPECT_NE(result.diagnostics[0].find("Content-Length"), std::string::npos);
}

TEST(MultipartDecoderTest, TruncatedStreamKeepsCompleteParts) {
    const std::string body = sizedPart("a", "Ram", "AAAA", true)
        + sizedPart("b", "Shyam", "BBBBBBBB", false).substr(0, 80);

    const auto result = decodeText(body);
    EXPECT_FALSE(result.terminated);
    ASSERT_EQ(result.parts.size(), 1u);
    EXPECT_EQ(result.parts[0].id, "a");
}

TEST(MultipartDecoderTest, ShortBodyIsReportedAtFinish) {
    const std::string body = sizedPart("a", "Ram", "0123456789", true).substr(0, 100);
    ASSERT_LT(body.size(), sizedPart("a", "Ram", "0123456789", true).size());

    const auto result = decodeText(body);
    EXPECT_TRUE(result.parts.empty());
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_NE(result.diagnostics[0].find("truncated body"), std::string::npos);
}

TEST(MultipartDecoderTest, BodyWithoutAnyDelimiterFails) {
    const std::string body = "<html>Service unavailable</html>";
    EXPECT_THROW(decodeText(body), ProtocolError);

    MultipartDecoder empty("B", nullptr);
    EXPECT_NO_THROW(empty.finish());
}

TEST(MultipartDecoderTest, NothingAfterTerminatorIsDecoded) {
    const std::string body = sizedPart("a", "Ram", "A", true)
        + "\r\n--B--\r\n"
        + sizedPart("z", "Late", "Z", false);

    const auto result = decodeText(body);
    ASSERT_EQ(result.parts.size(), 1u);
    EXPECT_EQ(result.parts[0].id, "a");
}

TEST(MultipartDecoderTest, BoundaryPrefixInsideUnsizedBodyIsData) {
    const std::string body = "--B\r\nX-Record-Id: a\r\n\r\nline1\r\n--Bogus data\r\nline3\r\n--B--\r\n";

    const auto result = decodeText(body);
    EXPECT_TRUE(result.terminated);
    ASSERT_EQ(result.parts.size(), 1u);
    EXPECT_EQ(asString(result.parts[0].bytes), "line1\r\n--Bogus data\r\nline3");
    EXPECT_TRUE(result.diagnostics.empty());
}

TEST(MultipartDecoderTest, UnsizedBodyWaitsForWhatFollowsTheDelimiter) {
    std::vector<DecodedPart> parts;
    MultipartDecoder decoder("B", [&](DecodedPart&& part) { parts.push_back(std::move(part)); });

    const std::string head = "--B\r\nX-Record-Id: a\r\n\r\nabc\r\n--B";
    decoder.feed(head.data(), head.size());
    EXPECT_TRUE(parts.empty());

    const std::string falseMatch = "x\r\nmore\r\n--B";
    decoder.feed(falseMatch.data(), falseMatch.size());
    EXPECT_TRUE(parts.empty());

    const std::string rest = "\r\nX-Record-Id: b\r\n\r\nz\r\n--B--";
    decoder.feed(rest.data(), rest.size());
    decoder.finish();

    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(asString(parts[0].bytes), "abc\r\n--Bx\r\nmore");
    EXPECT_EQ(parts[1].id, "b");
    EXPECT_EQ(asString(parts[1].bytes), "z");
    EXPECT_TRUE(decoder.terminated());
}
