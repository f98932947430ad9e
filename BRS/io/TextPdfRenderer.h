#pragma once
#include <string>
#include <vector>

#include "../core/DocumentRenderer.h"

// Renders a record as a one-page PDF: the display name as heading, then one
// "key: value" line per field, in Helvetica. A combined document has one such
// page per record.
class TextPdfRenderer : public DocumentRenderer
{
public:
    explicit TextPdfRenderer(std::vector<std::string> requiredFields = {});

    std::vector<char> render(const RecordRef& record) override;
    std::vector<char> renderCombined(const std::vector<RecordRef>& records,
        std::vector<SkippedItem>& skipped) override;

    static std::string escapePdfText(const std::string& text);

private:
    // Content stream of one page. Throws RenderError.
    std::string pageContent(const RecordRef& record) const;
    static std::vector<char> assemble(const std::vector<std::string>& pages);

private:
    std::vector<std::string> required;
};
