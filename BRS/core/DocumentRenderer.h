#pragma once
#include <vector>

#include "utils.h"

class DocumentRenderer {
public:
    virtual ~DocumentRenderer() = default;

    // Throws RenderError when the record cannot be rendered.
    virtual std::vector<char> render(const RecordRef& record) = 0;

    // One document holding every renderable record in order. Records that fail are
    // left out and reported in skipped (index is the position in records).
    // Throws RenderError when no record could be rendered.
    virtual std::vector<char> renderCombined(const std::vector<RecordRef>& records,
        std::vector<SkippedItem>& skipped) = 0;
};
