//
// Error messages carry enough detail to diagnose the input
//

#include <doctest/doctest.h>
#include <string>
#include <vector>

#include <pngmsg/chunk.hh>
#include <pngmsg/png.hh>
#include <pngmsg/exceptions.hh>

#include "test_utils.hh"

using namespace pngmsg;

TEST_CASE("Improved error messages") {
    SUBCASE("checksum mismatch - shows both values") {
        auto data = raw_chunk(42, "RuSt", secret_message, 2882656333u);
        try {
            chunk::parse(data);
            FAIL("Should have thrown exception");
        } catch (const crc_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("RuSt") != std::string::npos);
            CHECK(msg.find("2882656333") != std::string::npos);
            CHECK(msg.find("2882656334") != std::string::npos);
            INFO("Error message: " << msg);
        }
    }

    SUBCASE("short payload - shows declared and available sizes") {
        auto data = raw_chunk(500, "ruSt", "short", 0);
        try {
            chunk::parse(data);
            FAIL("Should have thrown exception");
        } catch (const data_length_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("500") != std::string::npos);
            CHECK(msg.find("9") != std::string::npos);
            INFO("Error message: " << msg);
        }
    }

    SUBCASE("bad type byte - shows byte value") {
        auto data = raw_chunk(0, "Ru1t", "", 0);
        try {
            chunk::parse(data);
            FAIL("Should have thrown exception");
        } catch (const chunk_type_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("49") != std::string::npos);  // '1'
            CHECK(msg.find("ASCII letter") != std::string::npos);
            INFO("Error message: " << msg);
        }
    }

    SUBCASE("bad type length - shows length") {
        try {
            chunk_type::from_string("TOOLONG");
            FAIL("Should have thrown exception");
        } catch (const chunk_type_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("TOOLONG") != std::string::npos);
            CHECK(msg.find("length 7") != std::string::npos);
            INFO("Error message: " << msg);
        }
    }

    SUBCASE("bad signature - names the problem") {
        auto data = to_bytes("not a png file");
        try {
            png::parse(data);
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("signature") != std::string::npos);
            INFO("Error message: " << msg);
        }
    }

    SUBCASE("all library errors share a base") {
        auto data = to_bytes("x");
        CHECK_THROWS_AS(png::parse(data), pngmsg_error);
        CHECK_THROWS_AS(chunk_type::from_string("x"), pngmsg_error);
    }
}
