#include <catch2/catch_test_macros.hpp>
#include "bitbrush/pattern/MirrorTable.hpp"

using namespace bitbrush;

TEST_CASE("MirrorTable - Known byte reversals", "[mirror][table]") {
    MirrorTable table;

    REQUIRE(table.Lookup(0x00) == 0x00);
    REQUIRE(table.Lookup(0xFF) == 0xFF);
    REQUIRE(table.Lookup(0x01) == 0x80);
    REQUIRE(table.Lookup(0x80) == 0x01);
    REQUIRE(table.Lookup(0x0F) == 0xF0);
    REQUIRE(table.Lookup(0x12) == 0x48);
    REQUIRE(table.Lookup(0xA0) == 0x05);
}

TEST_CASE("MirrorTable - Involution over every byte", "[mirror][table]") {
    MirrorTable table;

    for (unsigned b = 0; b < MirrorTable::Size(); ++b) {
        auto byte = static_cast<uint8_t>(b);
        REQUIRE(table.Lookup(table.Lookup(byte)) == byte);
    }
}

TEST_CASE("MirrorTable - Reversal matches bit-by-bit definition", "[mirror][table]") {
    MirrorTable table;

    for (unsigned b = 0; b < MirrorTable::Size(); ++b) {
        uint8_t reversed = table.Lookup(static_cast<uint8_t>(b));
        for (int bit = 0; bit < 8; ++bit) {
            bool source = (b >> bit) & 1u;
            bool target = (reversed >> (7 - bit)) & 1u;
            REQUIRE(source == target);
        }
    }
}
