#include "StreamProducer.h"
#include "errors.h"

StreamProducer::StreamProducer(const Job& j, DocumentRenderer& r, Logger& log)
    : job(j),
    renderer(r),
    logger(log) {
}

bool StreamProducer::hasWork() const {
    return !job.items.empty();
}

std::optional<RenderedPart> StreamProducer::next() {
    const std::size_t total = job.items.size();

    while (!stopped && cursor < total) {
        const std::size_t index = cursor++;
        const RecordRef& record = job.items[index];

        try {
            RenderedPart part{};
            part.index = index;
            part.id = record.id;
            part.displayName = record.displayName;
            part.bytes = renderer.render(record);

            ++producedCount;
            logger.debug("Rendered " + std::to_string(index + 1) + "/" + std::to_string(total)
                + ": " + record.displayName + " (" + std::to_string(part.bytes.size()) + " bytes)");
            return part;
        }
        catch (const RenderError& e) {
            logger.error("Render failed for record " + record.id + " (" + std::to_string(index + 1)
                + "/" + std::to_string(total) + "): " + e.what());
            skippedItems.push_back({ index, record.id, record.displayName, e.what() });
        }
        catch (const std::exception& e) {
            logger.error("Unexpected renderer failure for record " + record.id + ": " + e.what());
            skippedItems.push_back({ index, record.id, record.displayName, e.what() });
        }
    }

    return std::nullopt;
}

void StreamProducer::stop() {
    stopped = true;
}

bool StreamProducer::exhausted() const {
    return stopped || cursor >= job.items.size();
}

std::size_t StreamProducer::delivered() const {
    return producedCount;
}

const std::vector<SkippedItem>& StreamProducer::skipped() const {
    return skippedItems;
}
