#include "document.hpp"
#include "util.hpp"

namespace trickle {

const char* block_kind_name(BlockKind kind) {
    switch (kind) {
        case BlockKind::Paragraph: return "paragraph";
        case BlockKind::Heading:   return "heading";
        case BlockKind::CodeBlock: return "code";
        case BlockKind::List:      return "list";
        case BlockKind::Quote:     return "quote";
        case BlockKind::Table:     return "table";
        case BlockKind::Rule:      return "rule";
        case BlockKind::Text:      return "text";
        case BlockKind::Cursor:    return "cursor";
    }
    return "unknown";
}

bool Block::operator==(const Block& other) const {
    return kind == other.kind && text == other.text &&
           source_begin == other.source_begin && source_end == other.source_end &&
           open == other.open && level == other.level && info == other.info;
}

bool StructuredDocument::has_cursor() const {
    return !blocks.empty() && blocks.back().kind == BlockKind::Cursor;
}

bool StructuredDocument::operator==(const StructuredDocument& other) const {
    return blocks == other.blocks;
}

static bool is_blank_line(const std::string& text, size_t begin, size_t end) {
    for (size_t i = begin; i < end; ++i) {
        if (!is_break_char(text[i])) return false;
    }
    return true;
}

StructuredDocument plain_document(const std::string& text) {
    StructuredDocument doc;
    size_t pos = 0;
    bool in_block = false;
    size_t block_begin = 0;
    size_t block_end = 0;

    auto flush = [&]() {
        if (!in_block) return;
        Block b;
        b.kind = BlockKind::Text;
        b.source_begin = block_begin;
        b.source_end = block_end;
        b.text = text.substr(block_begin, block_end - block_begin);
        doc.blocks.push_back(std::move(b));
        in_block = false;
    };

    while (pos < text.size()) {
        size_t eol = text.find('\n', pos);
        size_t line_end = eol == std::string::npos ? text.size() : eol;
        if (is_blank_line(text, pos, line_end)) {
            flush();
        } else {
            if (!in_block) {
                in_block = true;
                block_begin = pos;
            }
            block_end = line_end;
        }
        if (eol == std::string::npos) break;
        pos = eol + 1;
    }
    flush();
    return doc;
}

bool is_well_formed(const StructuredDocument& doc, size_t text_size) {
    size_t last_end = 0;
    for (const auto& b : doc.blocks) {
        if (b.kind == BlockKind::Cursor) return false;
        if (b.source_begin > b.source_end) return false;
        if (b.source_end > text_size) return false;
        if (b.source_begin < last_end) return false;
        last_end = b.source_end;
    }
    return true;
}

} // namespace trickle
