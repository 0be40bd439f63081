#include <catch2/catch.hpp>
#include "document.hpp"

using namespace trickle;

TEST_CASE("plain_document: one block per paragraph", "[document]") {
    std::string text = "first line\nsecond line\n\nnext para";
    auto doc = plain_document(text);
    REQUIRE(doc.blocks.size() == 2);

    REQUIRE(doc.blocks[0].kind == BlockKind::Text);
    REQUIRE(doc.blocks[0].text == "first line\nsecond line");
    REQUIRE(doc.blocks[0].source_begin == 0);
    REQUIRE(doc.blocks[0].source_end == 22);

    REQUIRE(doc.blocks[1].text == "next para");
    REQUIRE(doc.blocks[1].source_begin == 24);
    REQUIRE(doc.blocks[1].source_end == text.size());
}

TEST_CASE("plain_document: empty and blank text", "[document]") {
    REQUIRE(plain_document("").empty());
    REQUIRE(plain_document("\n \n\t\n").empty());
}

TEST_CASE("plain_document: output is well formed", "[document]") {
    std::string text = "\n\na\n\n\nb c\nd\n";
    auto doc = plain_document(text);
    REQUIRE(doc.blocks.size() == 2);
    REQUIRE(is_well_formed(doc, text.size()));
}

TEST_CASE("is_well_formed: rejects bad ranges", "[document]") {
    StructuredDocument doc;
    Block a;
    a.source_begin = 0;
    a.source_end = 5;
    doc.blocks.push_back(a);
    REQUIRE(is_well_formed(doc, 5));
    REQUIRE_FALSE(is_well_formed(doc, 4));

    Block overlap;
    overlap.source_begin = 3;
    overlap.source_end = 5;
    doc.blocks.push_back(overlap);
    REQUIRE_FALSE(is_well_formed(doc, 10));
}

TEST_CASE("is_well_formed: rejects reversed range and cursor", "[document]") {
    StructuredDocument doc;
    Block reversed;
    reversed.source_begin = 4;
    reversed.source_end = 2;
    doc.blocks.push_back(reversed);
    REQUIRE_FALSE(is_well_formed(doc, 10));

    StructuredDocument with_cursor;
    Block cursor;
    cursor.kind = BlockKind::Cursor;
    with_cursor.blocks.push_back(cursor);
    REQUIRE_FALSE(is_well_formed(with_cursor, 0));
    REQUIRE(with_cursor.has_cursor());
}

TEST_CASE("StructuredDocument: equality compares every field", "[document]") {
    auto a = plain_document("x\n\ny");
    auto b = plain_document("x\n\ny");
    REQUIRE(a == b);
    b.blocks[1].open = true;
    REQUIRE(a != b);
}

TEST_CASE("block_kind_name: names", "[document]") {
    REQUIRE(std::string(block_kind_name(BlockKind::CodeBlock)) == "code");
    REQUIRE(std::string(block_kind_name(BlockKind::Cursor)) == "cursor");
}

TEST_CASE("PlainRenderer: matches plain_document", "[document]") {
    PlainRenderer r;
    std::string text = "a\n\nb";
    REQUIRE(r.render(text) == plain_document(text));
}
