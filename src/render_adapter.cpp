#include "render_adapter.hpp"
#include "util.hpp"

#include <iostream>
#include <stdexcept>

namespace trickle {

RenderAdapter::RenderAdapter(const MarkupRenderer& renderer, std::string cursor_marker)
    : renderer_(renderer), cursor_marker_(std::move(cursor_marker))
{}

void RenderAdapter::reset() {
    has_previous_ = false;
    last_text_.clear();
    last_document_.blocks.clear();
}

StructuredDocument RenderAdapter::apply(const std::string& visible_text, bool show_cursor) {
    StructuredDocument doc = apply(visible_text);
    if (show_cursor) {
        Block cursor;
        cursor.kind = BlockKind::Cursor;
        cursor.text = cursor_marker_;
        cursor.source_begin = visible_text.size();
        cursor.source_end = visible_text.size();
        doc.blocks.push_back(std::move(cursor));
    }
    return doc;
}

size_t RenderAdapter::stable_prefix_blocks(size_t common) const {
    const auto& blocks = last_document_.blocks;
    size_t k = 0;
    // The last block can always grow, so it is never kept
    while (k + 1 < blocks.size()) {
        const Block& b = blocks[k];
        const Block& next = blocks[k + 1];
        if (b.open || b.source_end > common || next.source_begin > common) break;
        ++k;
    }
    return k;
}

StructuredDocument RenderAdapter::render_full(const std::string& text, bool& ok) {
    ok = false;
    try {
        StructuredDocument doc = renderer_.render(text);
        if (is_well_formed(doc, text.size())) {
            ok = true;
            ++stats_.full;
            return doc;
        }
        std::cerr << "[render] renderer returned malformed structure for "
                  << text.size() << " bytes, showing plain text\n";
    } catch (const std::exception& e) {
        std::cerr << "[render] renderer failed: " << e.what() << ", showing plain text\n";
    }
    ++stats_.fallbacks;
    return plain_document(text);
}

StructuredDocument RenderAdapter::apply(const std::string& visible_text) {
    if (has_previous_ && visible_text == last_text_) {
        ++stats_.skipped;
        return last_document_;
    }

    StructuredDocument result;
    bool done = false;

    if (has_previous_) {
        size_t common = common_prefix_length(last_text_, visible_text);
        size_t keep = stable_prefix_blocks(common);
        if (keep > 0) {
            size_t cut = last_document_.blocks[keep].source_begin;
            std::string suffix = visible_text.substr(cut);
            try {
                StructuredDocument tail = renderer_.render(suffix);
                if (is_well_formed(tail, suffix.size())) {
                    result.blocks.assign(last_document_.blocks.begin(),
                                         last_document_.blocks.begin() + keep);
                    for (auto& b : tail.blocks) {
                        b.source_begin += cut;
                        b.source_end += cut;
                        result.blocks.push_back(std::move(b));
                    }
                    ++stats_.incremental;
                    stats_.reused_blocks += keep;
                    done = true;
                }
            } catch (const std::exception& e) {
                std::cerr << "[render] incremental render failed: " << e.what()
                          << ", re-rendering everything\n";
            }
        }
    }

    if (!done) {
        bool ok = false;
        result = render_full(visible_text, ok);
        if (!ok) {
            // Plain fallback is not retained; the next call retries a full render
            reset();
            return result;
        }
    }

    has_previous_ = true;
    last_text_ = visible_text;
    last_document_ = result;
    return result;
}

} // namespace trickle
