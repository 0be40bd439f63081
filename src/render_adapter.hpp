#pragma once
#include "document.hpp"
#include <cstdint>
#include <string>

namespace trickle {

struct RenderStats {
    uint64_t incremental = 0;   // suffix-only renders
    uint64_t full = 0;          // whole-text renders
    uint64_t fallbacks = 0;     // plain-text renders after a renderer failure
    uint64_t reused_blocks = 0; // leading blocks carried over unchanged
    uint64_t skipped = 0;       // identical input, previous output returned
};

// Renders visible text through a MarkupRenderer, re-rendering only the
// region that changed since the previous call.
//
// A leading block of the previous render is kept when it is closed, ends
// inside the prefix shared by the old and new text, and the block after it
// also starts inside that prefix. Everything from the first block that fails
// this is re-rendered as one suffix. When no block can be kept the whole text
// is rendered.
//
// The cursor marker is added to the returned copy only; the retained text
// and structure never contain it.
class RenderAdapter {
public:
    explicit RenderAdapter(const MarkupRenderer& renderer,
                           std::string cursor_marker = "\xE2\x96\x8D");

    StructuredDocument apply(const std::string& visible_text);
    StructuredDocument apply(const std::string& visible_text, bool show_cursor);

    // Forget the previous render (new content stream)
    void reset();

    bool has_previous() const { return has_previous_; }
    const StructuredDocument& last_document() const { return last_document_; }
    const std::string& last_text() const { return last_text_; }
    const RenderStats& stats() const { return stats_; }
    const std::string& cursor_marker() const { return cursor_marker_; }

private:
    // Number of leading blocks of last_document_ still valid for text
    size_t stable_prefix_blocks(size_t common) const;
    StructuredDocument render_full(const std::string& text, bool& ok);

    const MarkupRenderer& renderer_;
    std::string cursor_marker_;
    bool has_previous_ = false;
    std::string last_text_;
    StructuredDocument last_document_;
    RenderStats stats_;
};

} // namespace trickle
