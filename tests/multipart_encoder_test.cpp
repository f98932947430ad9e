#include <gtest/gtest.h>

#include "fakes.h"
#include "net/MultipartEncoder.h"

namespace {
RenderedPart makePart(std::size_t index, const std::string& id, const std::string& name, const std::string& bytes) {
    RenderedPart part{};
    part.index = index;
    part.id = id;
    part.displayName = name;
    part.bytes.assign(bytes.begin(), bytes.end());
    return part;
}
}

TEST(MultipartEncoderTest, BeginDeclaresBoundaryAndTotal) {
    QuietLog log;
    MemorySink sink;
    MultipartEncoder encoder(sink, log.logger, "XYZ");

    ASSERT_TRUE(encoder.begin(7, 600));
    EXPECT_EQ(sink.status, 200);
    EXPECT_EQ(sink.header("Content-Type"), "multipart/mixed; boundary=XYZ");
    EXPECT_EQ(sink.header("X-Total-Count"), "7");
    EXPECT_EQ(sink.header("Transfer-Encoding"), "chunked");
    EXPECT_EQ(sink.header("Keep-Alive"), "timeout=600");
    EXPECT_EQ(sink.header("Connection"), "keep-alive");
}

TEST(MultipartEncoderTest, PartHeaderLayout) {
    const RenderedPart part = makePart(1, "b", "Shyam", "12345");

    EXPECT_EQ(MultipartEncoder::partHeader("B", part, 2, false),
        "\r\n--B\r\n"
        "Content-Type: application/pdf\r\n"
        "Content-Disposition: attachment; filename=\"Shyam.pdf\"\r\n"
        "X-Display-Name: Shyam\r\n"
        "X-Record-Id: b\r\n"
        "X-Index: 1\r\n"
        "X-Total: 2\r\n"
        "Content-Length: 5\r\n"
        "\r\n");

    EXPECT_EQ(MultipartEncoder::partHeader("B", part, 2, true).rfind("--B\r\n", 0), 0u);
    EXPECT_EQ(MultipartEncoder::terminator("B"), "\r\n--B--\r\n");
}

TEST(MultipartEncoderTest, NamesArePercentEncoded) {
    const RenderedPart part = makePart(0, "id 1", "Ram Kumar/\xC3\xBC", "x");
    const std::string header = MultipartEncoder::partHeader("B", part, 1, true);

    EXPECT_NE(header.find("filename=\"Ram%20Kumar%2F%C3%BC.pdf\""), std::string::npos);
    EXPECT_NE(header.find("X-Display-Name: Ram%20Kumar%2F%C3%BC\r\n"), std::string::npos);
    EXPECT_NE(header.find("X-Record-Id: id%201\r\n"), std::string::npos);
}

TEST(MultipartEncoderTest, WritesPartsThenTerminator) {
    QuietLog log;
    MemorySink sink;
    CancellationToken cancel;
    MultipartEncoder encoder(sink, log.logger, "B");

    ASSERT_TRUE(encoder.begin(2, 600));
    ASSERT_TRUE(encoder.writePart(makePart(0, "a", "Ram", "AAA"), 2, cancel));
    ASSERT_TRUE(encoder.writePart(makePart(1, "b", "Shyam", "BB"), 2, cancel));
    ASSERT_TRUE(encoder.finish());

    const std::string body = sink.bodyCopy();
    EXPECT_EQ(body.rfind("--B\r\n", 0), 0u);
    EXPECT_NE(body.find("\r\n\r\nAAA\r\n--B\r\n"), std::string::npos);
    EXPECT_EQ(body.substr(body.size() - 11), "BB\r\n--B--\r\n");
    EXPECT_TRUE(sink.ended);

    EXPECT_EQ(encoder.partsWritten(), 2u);
    EXPECT_EQ(encoder.state().lastIndexSent, 1);
    EXPECT_EQ(encoder.state().bytesWrittenSoFar, body.size());
    EXPECT_TRUE(encoder.state().clientConnected);
}

TEST(MultipartEncoderTest, CancelledJobWritesNothing) {
    QuietLog log;
    MemorySink sink;
    CancellationToken cancel;
    MultipartEncoder encoder(sink, log.logger, "B");

    ASSERT_TRUE(encoder.begin(1, 600));
    cancel.cancel();
    EXPECT_FALSE(encoder.writePart(makePart(0, "a", "Ram", "AAA"), 1, cancel));
    EXPECT_TRUE(sink.bodyCopy().empty());
    EXPECT_EQ(encoder.partsWritten(), 0u);
}

TEST(MultipartEncoderTest, DisconnectedPeerIsNotWritten) {
    QuietLog log;
    MemorySink sink;
    sink.disconnectAfter = 0;
    CancellationToken cancel;
    MultipartEncoder encoder(sink, log.logger, "B");

    ASSERT_TRUE(encoder.begin(1, 600));
    EXPECT_FALSE(encoder.writePart(makePart(0, "a", "Ram", "AAA"), 1, cancel));
    EXPECT_FALSE(encoder.state().clientConnected);
}

TEST(MultipartEncoderTest, TransportFailureMidPartThrows) {
    QuietLog log;
    MemorySink sink;
    // Header goes out, body does not
    sink.disconnectAfter = 1;
    CancellationToken cancel;
    MultipartEncoder encoder(sink, log.logger, "B");

    ASSERT_TRUE(encoder.begin(1, 600));
    EXPECT_THROW(encoder.writePart(makePart(0, "a", "Ram", "AAA"), 1, cancel), TransportWriteError);
    EXPECT_FALSE(encoder.state().clientConnected);
}

TEST(MultipartEncoderTest, BackpressureWaitsForDrain) {
    QuietLog log;
    MemorySink sink;
    sink.alwaysBackpressure = true;
    CancellationToken cancel;
    MultipartEncoder encoder(sink, log.logger, "B");

    ASSERT_TRUE(encoder.begin(1, 600));
    EXPECT_TRUE(encoder.writePart(makePart(0, "a", "Ram", "AAA"), 1, cancel));
    EXPECT_EQ(sink.drainWaits.load(), 1);
}

TEST(MultipartEncoderTest, DrainThatNeverHappensThrows) {
    QuietLog log;
    MemorySink sink;
    sink.alwaysBackpressure = true;
    sink.neverDrain = true;
    sink.drainTimeout = std::chrono::milliseconds(20);
    CancellationToken cancel;
    MultipartEncoder encoder(sink, log.logger, "B");

    ASSERT_TRUE(encoder.begin(1, 600));
    EXPECT_THROW(encoder.writePart(makePart(0, "a", "Ram", "AAA"), 1, cancel), TransportWriteError);
}

TEST(MultipartEncoderTest, AbortLeavesBodyUnterminated) {
    QuietLog log;
    MemorySink sink;
    CancellationToken cancel;
    MultipartEncoder encoder(sink, log.logger, "B");

    ASSERT_TRUE(encoder.begin(2, 600));
    ASSERT_TRUE(encoder.writePart(makePart(0, "a", "Ram", "AAA"), 2, cancel));
    encoder.abort();

    EXPECT_TRUE(sink.aborted);
    EXPECT_FALSE(sink.ended);
    EXPECT_EQ(sink.bodyCopy().find("--B--"), std::string::npos);
}
