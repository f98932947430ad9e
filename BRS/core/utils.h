#pragma once
#include <string>
#include <vector>
#include <utility>
#include <cstdint>
#include <cstddef>

struct ServerConfig {
    std::string dataDir;
    std::string bindAddress;
    std::uint16_t port;
    std::size_t workers;

    // Read and write timeout of a streaming connection, in seconds
    long streamTimeoutSec;
    std::size_t highWaterBytes;

    std::vector<std::string> requiredFields;
};

struct FetchConfig {
    std::string baseUrl;
    std::string jobId;
    std::string outputDir;
    std::string title;

    bool bulk;
    // One PDF holding every record instead of a file per record
    bool combined;
    // Fetch this record alone when set
    std::string recordId;
    // Narrows the job to these records; empty means all of them
    std::vector<std::string> onlyIds;

    // Longest wait for the next byte of the response, in seconds
    long timeoutSec;
    long intervalMs;
};

using RenderField = std::pair<std::string, std::string>;

struct RecordRef {
    std::string id;
    std::string displayName;
    std::vector<RenderField> renderInput;
};

struct Job {
    std::string id;
    std::string title;
    std::vector<RecordRef> items;

    std::size_t total() const { return items.size(); }
};

struct RenderedPart {
    std::size_t index;
    std::string id;
    std::string displayName;
    std::vector<char> bytes;

    std::size_t byteLength() const { return bytes.size(); }
};

struct SkippedItem {
    std::size_t index;
    std::string id;
    std::string displayName;
    std::string reason;
};

enum class StreamOutcome {
    Completed,
    Cancelled,
    TransportFailed
};

struct StreamReport {
    std::string boundary;
    std::size_t total = 0;
    std::size_t delivered = 0;
    std::uint64_t bytesWritten = 0;
    std::vector<SkippedItem> skipped;
    StreamOutcome outcome = StreamOutcome::Completed;
    std::string error;
};

// One item reconstructed on the receiving side
struct DecodedPart {
    std::size_t index;
    std::string id;
    std::string displayName;
    std::vector<char> bytes;
};

enum class FetchOutcome {
    Completed,
    NotFound,
    Failed,
    Cancelled
};

struct FetchReport {
    FetchOutcome outcome = FetchOutcome::Failed;
    std::size_t expected = 0;
    std::size_t received = 0;
    std::size_t saved = 0;
    std::size_t failedSaves = 0;
    std::vector<std::string> diagnostics;
    std::string error;
};
