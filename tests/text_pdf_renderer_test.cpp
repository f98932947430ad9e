#include <gtest/gtest.h>

#include "fakes.h"
#include "io/TextPdfRenderer.h"

namespace {
RecordRef sample() {
    RecordRef record;
    record.id = "S-001";
    record.displayName = "Ram (North)";
    record.renderInput = { { "Crop", "Wheat" }, { "pH", "6.5" } };
    return record;
}
}

TEST(TextPdfRendererTest, ProducesSinglePagePdf) {
    TextPdfRenderer renderer;
    const std::string pdf = asString(renderer.render(sample()));

    EXPECT_EQ(pdf.rfind("%PDF-1.4\n", 0), 0u);
    EXPECT_EQ(pdf.substr(pdf.size() - 6), "%%EOF\n");
    EXPECT_NE(pdf.find("/Count 1"), std::string::npos);
    EXPECT_NE(pdf.find("(Ram \\(North\\)) Tj"), std::string::npos);
    EXPECT_NE(pdf.find("(Crop: Wheat) Tj"), std::string::npos);
    EXPECT_NE(pdf.find("(pH: 6.5) Tj"), std::string::npos);
}

TEST(TextPdfRendererTest, CrossReferenceOffsetsAreExact) {
    TextPdfRenderer renderer;
    const std::string pdf = asString(renderer.render(sample()));

    const auto startxref = pdf.rfind("startxref\n");
    ASSERT_NE(startxref, std::string::npos);
    const std::size_t xrefPos = std::stoul(pdf.substr(startxref + 10));
    ASSERT_EQ(pdf.compare(xrefPos, 4, "xref"), 0);

    // Entries follow "xref\n0 6\n" and the free-list head, 20 bytes each
    std::size_t entry = pdf.find("0000000000 65535 f \n", xrefPos) + 20;
    for (int obj = 1; obj <= 5; ++obj) {
        const std::size_t offset = std::stoul(pdf.substr(entry, 10));
        const std::string marker = std::to_string(obj) + " 0 obj";
        EXPECT_EQ(pdf.compare(offset, marker.size(), marker), 0) << "object " << obj;
        entry += 20;
    }
}

TEST(TextPdfRendererTest, StreamLengthMatchesContent) {
    TextPdfRenderer renderer;
    const std::string pdf = asString(renderer.render(sample()));

    const auto lengthPos = pdf.find("/Length ");
    ASSERT_NE(lengthPos, std::string::npos);
    const std::size_t length = std::stoul(pdf.substr(lengthPos + 8));

    const auto begin = pdf.find("stream\n", lengthPos) + 7;
    const auto end = pdf.find("endstream", begin);
    EXPECT_EQ(end - begin, length);
}

TEST(TextPdfRendererTest, RecordWithoutFieldsFails) {
    TextPdfRenderer renderer;
    RecordRef record = sample();
    record.renderInput.clear();

    EXPECT_THROW(renderer.render(record), RenderError);
}

TEST(TextPdfRendererTest, RequiredFieldMustBePresentAndNonEmpty) {
    TextPdfRenderer renderer({ "Crop", "Farmer" });
    EXPECT_THROW(renderer.render(sample()), RenderError);

    RecordRef record = sample();
    record.renderInput.push_back({ "Farmer", "" });
    EXPECT_THROW(renderer.render(record), RenderError);

    record.renderInput.back().second = "Ram";
    EXPECT_NO_THROW(renderer.render(record));
}

TEST(TextPdfRendererTest, EscapesTextForStandardFonts) {
    EXPECT_EQ(TextPdfRenderer::escapePdfText("a(b)\\c"), "a\\(b\\)\\\\c");
    EXPECT_EQ(TextPdfRenderer::escapePdfText("R\xC4\x81m"), "R?m");
    EXPECT_EQ(TextPdfRenderer::escapePdfText("tab\there"), "tab?here");
}

TEST(TextPdfRendererTest, FallsBackToIdWhenNameIsEmpty) {
    TextPdfRenderer renderer;
    RecordRef record = sample();
    record.displayName.clear();

    const std::string pdf = asString(renderer.render(record));
    EXPECT_NE(pdf.find("(S-001) Tj"), std::string::npos);
}

TEST(TextPdfRendererTest, CombinedDocumentHasOnePagePerRecord) {
    TextPdfRenderer renderer({ "Crop" });
    RecordRef second = sample();
    second.id = "S-002";
    second.displayName = "Shyam";
    RecordRef broken = sample();
    broken.id = "S-003";
    broken.renderInput = { { "pH", "7.1" } };

    std::vector<SkippedItem> skipped;
    const std::string pdf = asString(renderer.renderCombined({ sample(), broken, second }, skipped));

    EXPECT_NE(pdf.find("/Kids [4 0 R 6 0 R] /Count 2"), std::string::npos);
    EXPECT_LT(pdf.find("(Ram \\(North\\)) Tj"), pdf.find("(Shyam) Tj"));
    ASSERT_EQ(skipped.size(), 1u);
    EXPECT_EQ(skipped[0].id, "S-003");
    EXPECT_EQ(skipped[0].index, 1u);

    // Every xref entry points at its object
    const std::size_t xrefPos = std::stoul(pdf.substr(pdf.rfind("startxref\n") + 10));
    std::size_t entry = pdf.find("0000000000 65535 f \n", xrefPos) + 20;
    for (int obj = 1; obj <= 7; ++obj) {
        const std::string marker = std::to_string(obj) + " 0 obj";
        EXPECT_EQ(pdf.compare(std::stoul(pdf.substr(entry, 10)), marker.size(), marker), 0) << "object " << obj;
        entry += 20;
    }
}

TEST(TextPdfRendererTest, CombinedDocumentNeedsOneRenderableRecord) {
    TextPdfRenderer renderer({ "Farmer" });
    std::vector<SkippedItem> skipped;

    EXPECT_THROW(renderer.renderCombined({ sample() }, skipped), RenderError);
    EXPECT_EQ(skipped.size(), 1u);
}
