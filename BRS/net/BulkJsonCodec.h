#pragma once
#include <string>
#include <vector>

#include "../core/utils.h"
#include "../core/StreamProducer.h"

// Non-streaming form of a job: one JSON document holding every rendered item.
//   { "jobId", "count", "total", "items": [{ "id", "displayName", "data" }], "skipped": [...] }
// "data" is the base64 of the whole document.
class BulkJsonCodec {
public:
    // Drains the producer completely.
    static std::string encode(const std::string& jobId, std::size_t total, StreamProducer& producer);

    struct Decoded {
        std::size_t count = 0;
        std::size_t total = 0;
        std::vector<DecodedPart> items;
        std::vector<SkippedItem> skipped;
        std::vector<std::string> diagnostics;
    };

    // Throws ProtocolError when the body is not a bulk document.
    // A single item with bad data is dropped and noted.
    static Decoded decode(const std::string& body);
};
