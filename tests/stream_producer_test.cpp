#include <gtest/gtest.h>

#include "fakes.h"
#include "core/StreamProducer.h"

TEST(StreamProducerTest, YieldsRecordsLazilyInOrder) {
    QuietLog log;
    ScriptedRenderer renderer;
    const Job job = makeJob("j", { { "a", "Ram" }, { "b", "Shyam" }, { "c", "Gita" } });
    StreamProducer producer(job, renderer, log.logger);

    EXPECT_TRUE(producer.hasWork());
    EXPECT_EQ(renderer.calls.load(), 0);

    auto first = producer.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(renderer.calls.load(), 1);
    EXPECT_EQ(first->index, 0u);
    EXPECT_EQ(first->id, "a");
    EXPECT_EQ(first->displayName, "Ram");
    EXPECT_EQ(asString(first->bytes), "%PDF-a:Ram");
    EXPECT_EQ(first->byteLength(), first->bytes.size());

    EXPECT_EQ(producer.next()->id, "b");
    EXPECT_EQ(producer.next()->id, "c");
    EXPECT_FALSE(producer.next().has_value());
    EXPECT_TRUE(producer.exhausted());
    EXPECT_EQ(producer.delivered(), 3u);
    EXPECT_EQ(renderer.calls.load(), 3);
}

TEST(StreamProducerTest, EmptyJobHasNoWork) {
    QuietLog log;
    ScriptedRenderer renderer;
    const Job job = makeJob("none", {});
    StreamProducer producer(job, renderer, log.logger);

    EXPECT_FALSE(producer.hasWork());
    EXPECT_FALSE(producer.next().has_value());
    EXPECT_EQ(renderer.calls.load(), 0);
}

TEST(StreamProducerTest, FailingRecordsAreSkippedAndListed) {
    QuietLog log;
    ScriptedRenderer renderer;
    renderer.failing = { "3", "5" };
    const Job job = makeJob("j", { { "1", "A" }, { "2", "B" }, { "3", "C" }, { "4", "D" }, { "5", "E" } });
    StreamProducer producer(job, renderer, log.logger);

    std::vector<std::size_t> indexes;
    while (auto part = producer.next())
        indexes.push_back(part->index);

    EXPECT_EQ(indexes, (std::vector<std::size_t>{ 0, 1, 3 }));
    EXPECT_EQ(producer.delivered(), 3u);
    ASSERT_EQ(producer.skipped().size(), 2u);
    EXPECT_EQ(producer.skipped()[0].id, "3");
    EXPECT_EQ(producer.skipped()[0].index, 2u);
    EXPECT_EQ(producer.skipped()[0].displayName, "C");
    EXPECT_EQ(producer.skipped()[1].id, "5");
}

TEST(StreamProducerTest, UnexpectedRendererExceptionIsSkippedToo) {
    struct ThrowingRenderer : DocumentRenderer {
        std::vector<char> render(const RecordRef& record) override {
            if (record.id == "a")
                throw std::out_of_range("template missing");
            return { 'o', 'k' };
        }
        std::vector<char> renderCombined(const std::vector<RecordRef>&, std::vector<SkippedItem>&) override {
            return {};
        }
    };

    QuietLog log;
    ThrowingRenderer renderer;
    const Job job = makeJob("j", { { "a", "A" }, { "b", "B" } });
    StreamProducer producer(job, renderer, log.logger);

    auto part = producer.next();
    ASSERT_TRUE(part.has_value());
    EXPECT_EQ(part->id, "b");
    ASSERT_EQ(producer.skipped().size(), 1u);
    EXPECT_EQ(producer.skipped()[0].reason, "template missing");
}

TEST(StreamProducerTest, StopEndsTheSequence) {
    QuietLog log;
    ScriptedRenderer renderer;
    const Job job = makeJob("j", { { "a", "A" }, { "b", "B" }, { "c", "C" } });
    StreamProducer producer(job, renderer, log.logger);

    ASSERT_TRUE(producer.next().has_value());
    producer.stop();

    EXPECT_TRUE(producer.exhausted());
    EXPECT_FALSE(producer.next().has_value());
    EXPECT_EQ(renderer.calls.load(), 1);
}
