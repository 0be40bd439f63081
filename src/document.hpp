#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace trickle {

enum class BlockKind {
    Paragraph,
    Heading,
    CodeBlock,
    List,
    Quote,
    Table,
    Rule,
    Text,   // unformatted text (plain rendering)
    Cursor  // trailing reveal cursor, presentation only
};

const char* block_kind_name(BlockKind kind);

// One top-level element of a rendered document. source_begin/source_end
// are byte offsets into the text that was rendered.
struct Block {
    BlockKind kind = BlockKind::Paragraph;
    std::string text;
    size_t source_begin = 0;
    size_t source_end = 0;
    bool open = false; // unterminated construct, e.g. a code fence still missing its close
    int level = 0;     // heading level, list depth
    std::string info;  // fence language, link target

    bool operator==(const Block& other) const;
    bool operator!=(const Block& other) const { return !(*this == other); }
};

struct StructuredDocument {
    std::vector<Block> blocks;

    bool empty() const { return blocks.empty(); }
    bool has_cursor() const;
    bool operator==(const StructuredDocument& other) const;
    bool operator!=(const StructuredDocument& other) const { return !(*this == other); }
};

// The external markup renderer. Must be deterministic and side-effect free.
class MarkupRenderer {
public:
    virtual ~MarkupRenderer() = default;
    virtual StructuredDocument render(const std::string& text) const = 0;
};

// Unformatted rendering: one Text block per run of non-blank lines
StructuredDocument plain_document(const std::string& text);

// Source ranges ordered, non-overlapping and inside [0, text_size]
bool is_well_formed(const StructuredDocument& doc, size_t text_size);

// Renderer that produces plain_document(); default for the CLI
class PlainRenderer : public MarkupRenderer {
public:
    StructuredDocument render(const std::string& text) const override {
        return plain_document(text);
    }
};

} // namespace trickle
