#include "BulkJsonCodec.h"
#include "Encoding.h"
#include "../core/errors.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::string BulkJsonCodec::encode(const std::string& jobId, std::size_t total, StreamProducer& producer) {
    json items = json::array();

    while (auto part = producer.next()) {
        items.push_back({
            { "id", part->id },
            { "displayName", part->displayName },
            { "index", part->index },
            { "data", encoding::base64Encode(part->bytes) }
            });
    }

    json skipped = json::array();
    for (const auto& item : producer.skipped()) {
        skipped.push_back({
            { "id", item.id },
            { "displayName", item.displayName },
            { "index", item.index },
            { "reason", item.reason }
            });
    }

    json doc{
        { "jobId", jobId },
        { "count", items.size() },
        { "total", total },
        { "items", std::move(items) },
        { "skipped", std::move(skipped) }
    };
    return doc.dump();
}

BulkJsonCodec::Decoded BulkJsonCodec::decode(const std::string& body) {
    json doc;
    try {
        doc = json::parse(body);
    }
    catch (const json::parse_error& e) {
        throw ProtocolError(std::string("bulk response is not valid JSON: ") + e.what());
    }

    if (!doc.is_object() || !doc.contains("items") || !doc["items"].is_array())
        throw ProtocolError("bulk response has no items array");

    Decoded out;
    const json& items = doc["items"];
    out.count = doc.value("count", items.size());
    out.total = doc.value("total", out.count);

    std::size_t position = 0;
    for (const auto& item : items) {
        const std::size_t ordinal = position++;
        try {
            DecodedPart part{};
            part.index = item.value("index", ordinal);
            part.id = item.at("id").get<std::string>();
            part.displayName = item.value("displayName", std::string());
            part.bytes = encoding::base64Decode(item.at("data").get<std::string>());

            if (part.bytes.empty()) {
                out.diagnostics.push_back("item " + std::to_string(ordinal) + " dropped: empty document");
                continue;
            }
            out.items.push_back(std::move(part));
        }
        catch (const json::exception& e) {
            out.diagnostics.push_back("item " + std::to_string(ordinal) + " dropped: " + e.what());
        }
        catch (const std::invalid_argument& e) {
            out.diagnostics.push_back("item " + std::to_string(ordinal) + " dropped: " + e.what());
        }
    }

    if (doc.contains("skipped") && doc["skipped"].is_array()) {
        for (const auto& item : doc["skipped"]) {
            if (!item.is_object())
                continue;
            SkippedItem skippedItem{};
            skippedItem.index = item.value("index", std::size_t{ 0 });
            skippedItem.id = item.value("id", std::string());
            skippedItem.displayName = item.value("displayName", std::string());
            skippedItem.reason = item.value("reason", std::string());
            out.skipped.push_back(std::move(skippedItem));
        }
    }

    return out;
}
