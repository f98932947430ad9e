#include "TextPdfRenderer.h"
#include "../core/errors.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace {
constexpr int kPageWidth = 595;
constexpr int kPageHeight = 842;
constexpr int kMargin = 56;
constexpr int kLineHeight = 16;
constexpr std::size_t kMaxLineChars = 90;
}

TextPdfRenderer::TextPdfRenderer(std::vector<std::string> requiredFields)
    : required(std::move(requiredFields)) {
}

std::string TextPdfRenderer::escapePdfText(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    for (char ch : text) {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (ch == '(' || ch == ')' || ch == '\\') {
            out.push_back('\\');
            out.push_back(ch);
        }
        else if (c < 0x20 || c > 0x7E) {
            // Standard fonts only cover ASCII; a UTF-8 sequence becomes one '?'
            if ((c & 0xC0) != 0x80)
                out.push_back('?');
        }
        else {
            out.push_back(ch);
        }
    }
    return out;
}

std::string TextPdfRenderer::pageContent(const RecordRef& record) const {
    if (record.renderInput.empty())
        throw RenderError("record " + record.id + " has no fields to render");

    for (const auto& field : required) {
        const bool present = std::any_of(record.renderInput.begin(), record.renderInput.end(),
            [&](const RenderField& f) { return f.first == field && !f.second.empty(); });
        if (!present)
            throw RenderError("record " + record.id + " is missing required field '" + field + "'");
    }

    std::ostringstream content;
    content << "BT\n/F1 16 Tf\n" << kMargin << ' ' << (kPageHeight - kMargin) << " Td\n"
        << '(' << escapePdfText(record.displayName.empty() ? record.id : record.displayName) << ") Tj\n"
        << "/F1 11 Tf\n0 -" << (kLineHeight * 2) << " Td\n";

    int y = kPageHeight - kMargin - kLineHeight * 2;
    for (const auto& field : record.renderInput) {
        if (y < kMargin) {
            content << "(...) Tj\n";
            break;
        }

        std::string line = field.first + ": " + field.second;
        if (line.size() > kMaxLineChars)
            line = line.substr(0, kMaxLineChars - 3) + "...";

        content << '(' << escapePdfText(line) << ") Tj\n0 -" << kLineHeight << " Td\n";
        y -= kLineHeight;
    }
    content << "ET\n";
    return content.str();
}

// Objects: 1 catalog, 2 page tree, 3 font, then a page and its content stream per page
std::vector<char> TextPdfRenderer::assemble(const std::vector<std::string>& pages) {
    std::ostringstream kids;
    for (std::size_t i = 0; i < pages.size(); ++i)
        kids << (i == 0 ? "" : " ") << (4 + 2 * i) << " 0 R";

    std::vector<std::string> objects;
    objects.push_back("<< /Type /Catalog /Pages 2 0 R >>");
    objects.push_back("<< /Type /Pages /Kids [" + kids.str() + "] /Count " + std::to_string(pages.size()) + " >>");
    objects.push_back("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>");

    for (std::size_t i = 0; i < pages.size(); ++i) {
        objects.push_back("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 " + std::to_string(kPageWidth) + ' '
            + std::to_string(kPageHeight) + "] /Resources << /Font << /F1 3 0 R >> >> /Contents "
            + std::to_string(5 + 2 * i) + " 0 R >>");
        objects.push_back("<< /Length " + std::to_string(pages[i].size()) + " >>\nstream\n" + pages[i] + "endstream");
    }

    std::ostringstream file;
    file << "%PDF-1.4\n";

    std::vector<long> offsets;
    offsets.reserve(objects.size());
    for (std::size_t i = 0; i < objects.size(); ++i) {
        offsets.push_back(static_cast<long>(file.tellp()));
        file << (i + 1) << " 0 obj\n" << objects[i] << "\nendobj\n";
    }

    const long xrefPos = static_cast<long>(file.tellp());
    file << "xref\n0 " << (objects.size() + 1) << "\n0000000000 65535 f \n";
    for (long off : offsets)
        file << std::setw(10) << std::setfill('0') << off << " 00000 n \n";
    file << "trailer\n<< /Size " << (objects.size() + 1) << " /Root 1 0 R >>\nstartxref\n"
        << xrefPos << "\n%%EOF\n";

    const std::string bytes = file.str();
    return std::vector<char>(bytes.begin(), bytes.end());
}

std::vector<char> TextPdfRenderer::render(const RecordRef& record) {
    return assemble({ pageContent(record) });
}

std::vector<char> TextPdfRenderer::renderCombined(const std::vector<RecordRef>& records,
    std::vector<SkippedItem>& skipped) {
    std::vector<std::string> pages;
    pages.reserve(records.size());

    for (std::size_t i = 0; i < records.size(); ++i) {
        try {
            pages.push_back(pageContent(records[i]));
        }
        catch (const RenderError& e) {
            skipped.push_back(SkippedItem{ i, records[i].id, records[i].displayName, e.what() });
        }
    }

    if (pages.empty())
        throw RenderError("none of the " + std::to_string(records.size()) + " records could be rendered");
    return assemble(pages);
}
