#include <doctest/doctest.h>
#include <pngme/png.hh>
#include <pngme/exceptions.hh>

#include "test_utils.hh"

using namespace pngme;

namespace {
    std::vector<chunk> testing_chunks() {
        return {
            chunk(chunk_type::parse("FrSt"), "I am the first chunk"),
            chunk(chunk_type::parse("miDl"), "I am another chunk"),
            chunk(chunk_type::parse("LASt"), "I am the last chunk")
        };
    }

    png testing_png() {
        return png(testing_chunks());
    }
}

TEST_SUITE("PNG") {
    TEST_CASE("png from chunk list") {
        auto p = testing_png();
        REQUIRE(p.size() == 3);
        CHECK(p.chunks()[0].type().to_string() == "FrSt");
        CHECK(p.chunks()[1].type().to_string() == "miDl");
        CHECK(p.chunks()[2].type().to_string() == "LASt");
        CHECK_FALSE(p.empty());
        CHECK(png().empty());
    }

    TEST_CASE("decode minimal file") {
        auto p = png::decode(minimal_png_bytes());
        REQUIRE(p.size() == 2);
        CHECK(p.chunks()[0].type() == chunk_types::IHDR);
        CHECK(p.chunks()[0].length() == 13);
        CHECK(p.chunks()[1].type() == chunk_types::IEND);
        CHECK(p.chunks()[1].length() == 0);
    }

    TEST_CASE("signature only decodes to an empty png") {
        auto p = png::decode(png_signature_bytes());
        CHECK(p.empty());
        CHECK(p.serialize() == png_signature_bytes());
    }

    TEST_CASE("serialize") {
        SUBCASE("reproduces decoded input byte for byte") {
            auto bytes = minimal_png_bytes();
            CHECK(png::decode(bytes).serialize() == bytes);
        }

        SUBCASE("starts with the signature") {
            auto bytes = testing_png().serialize();
            REQUIRE(bytes.size() >= 8);
            CHECK(std::vector<std::byte>(bytes.begin(), bytes.begin() + 8) == png_signature_bytes());
        }

        SUBCASE("concatenates chunk records in order") {
            auto p = testing_png();
            auto expected = png_signature_bytes();
            for (const auto& c : p.chunks()) {
                append(expected, c.serialize());
            }
            CHECK(p.serialize() == expected);
            CHECK(p.encoded_size() == expected.size());
        }

        SUBCASE("round trip") {
            auto p = testing_png();
            auto again = png::decode(p.serialize());
            CHECK(again == p);
            CHECK(again.serialize() == p.serialize());
        }

        SUBCASE("unknown and invalid chunk types survive") {
            auto bytes = png_signature_bytes();
            append(bytes, ihdr_chunk_bytes());
            append(bytes, chunk(chunk_type::parse("abcd"), "odd").serialize());
            append(bytes, chunk(chunk_type('1', '2', '3', '4'), "odder").serialize());
            append(bytes, iend_chunk_bytes());

            auto p = png::decode(bytes);
            CHECK(p.size() == 4);
            CHECK(p.serialize() == bytes);
        }
    }

    TEST_CASE("append_chunk") {
        auto p = testing_png();
        p.append_chunk(chunk(chunk_type::parse("TeSt"), "Message"));
        REQUIRE(p.size() == 4);
        CHECK(p.chunks().back().type().to_string() == "TeSt");
        CHECK(p.chunks().back().data_as_text() == "Message");
    }

    TEST_CASE("append_chunk allows repeated types") {
        auto p = testing_png();
        p.append_chunk(chunk(chunk_type::parse("miDl"), "second"));
        CHECK(p.size() == 4);
        REQUIRE(p.chunk_by_type("miDl") != nullptr);
        CHECK(p.chunk_by_type("miDl")->data_as_text() == "I am another chunk");
    }

    TEST_CASE("append_chunk does not validate the type") {
        auto p = testing_png();
        p.append_chunk(chunk(chunk_type::parse("Rust"), "reserved bit lowercase"));
        CHECK(p.size() == 4);
        CHECK(p.chunk_by_type("Rust") != nullptr);
    }

    TEST_CASE("chunk_by_type") {
        auto p = testing_png();

        SUBCASE("found") {
            const chunk* c = p.chunk_by_type("FrSt");
            REQUIRE(c != nullptr);
            CHECK(c->type().to_string() == "FrSt");
            CHECK(c->data_as_text() == "I am the first chunk");
        }

        SUBCASE("by chunk_type") {
            const chunk* c = p.chunk_by_type(chunk_type::parse("LASt"));
            REQUIRE(c != nullptr);
            CHECK(c->data_as_text() == "I am the last chunk");
        }

        SUBCASE("absent") {
            CHECK(p.chunk_by_type("NoNe") == nullptr);
        }

        SUBCASE("case matters") {
            CHECK(p.chunk_by_type("frst") == nullptr);
        }

        SUBCASE("wrong length matches nothing") {
            CHECK(p.chunk_by_type("FrS") == nullptr);
            CHECK(p.chunk_by_type("FrStt") == nullptr);
        }

        SUBCASE("lookup does not modify") {
            (void)p.chunk_by_type("miDl");
            CHECK(p == testing_png());
        }
    }

    TEST_CASE("remove_first_chunk_by_type") {
        auto p = testing_png();

        SUBCASE("removes and returns the chunk") {
            chunk removed = p.remove_first_chunk_by_type("miDl");
            CHECK(removed.data_as_text() == "I am another chunk");
            REQUIRE(p.size() == 2);
            CHECK(p.chunks()[0].type().to_string() == "FrSt");
            CHECK(p.chunks()[1].type().to_string() == "LASt");
            CHECK(p.chunk_by_type("miDl") == nullptr);
        }

        SUBCASE("removes only the first match") {
            p.append_chunk(chunk(chunk_type::parse("FrSt"), "duplicate"));
            chunk removed = p.remove_first_chunk_by_type("FrSt");
            CHECK(removed.data_as_text() == "I am the first chunk");
            REQUIRE(p.size() == 3);
            CHECK(p.chunks()[0].type().to_string() == "miDl");
            CHECK(p.chunks()[1].type().to_string() == "LASt");
            REQUIRE(p.chunk_by_type("FrSt") != nullptr);
            CHECK(p.chunk_by_type("FrSt")->data_as_text() == "duplicate");
        }

        SUBCASE("append then remove gives back the same chunk") {
            chunk c(chunk_type::parse("ruSt"), "hidden message");
            p.append_chunk(c);
            chunk removed = p.remove_first_chunk_by_type("ruSt");
            CHECK(removed == c);
            CHECK(p.chunk_by_type("ruSt") == nullptr);
            CHECK(p == testing_png());
        }

        SUBCASE("by chunk_type") {
            chunk removed = p.remove_first_chunk_by_type(chunk_type::parse("LASt"));
            CHECK(removed.type().to_string() == "LASt");
            CHECK(p.size() == 2);
        }

        SUBCASE("absent type throws and leaves the sequence alone") {
            CHECK_THROWS_AS(p.remove_first_chunk_by_type("NoNe"), chunk_not_found);
            CHECK_THROWS_AS(p.remove_first_chunk_by_type("toolong"), chunk_not_found);
            CHECK(p == testing_png());
        }

        SUBCASE("empty png") {
            png empty;
            CHECK_THROWS_AS(empty.remove_first_chunk_by_type("IEND"), chunk_not_found);
            CHECK(empty.empty());
        }
    }

    TEST_CASE("hide and recover a message") {
        auto p = png::decode(minimal_png_bytes());
        p.append_chunk(chunk(chunk_type::parse("ruSt"), "hidden message"));

        auto bytes = p.serialize();
        auto again = png::decode(bytes);

        REQUIRE(again.size() == 3);
        const chunk* hidden = again.chunk_by_type("ruSt");
        REQUIRE(hidden != nullptr);
        CHECK(hidden->data_as_text() == "hidden message");
        CHECK(hidden->crc() == 0xDA7F3A11u);

        CHECK(again.chunks()[0].type() == chunk_types::IHDR);
        CHECK(again.chunks()[1].type() == chunk_types::IEND);
        CHECK(again.chunks()[2].type().to_string() == "ruSt");
        CHECK(again.chunks()[0].serialize() == ihdr_chunk_bytes());
        CHECK(again.chunks()[1].serialize() == iend_chunk_bytes());

        // Removing the message restores the original file
        again.remove_first_chunk_by_type("ruSt");
        CHECK(again.serialize() == minimal_png_bytes());
    }
}
