#include <doctest/doctest.h>
#include <pngmsg/chunk_iterator.hh>
#include <pngmsg/png.hh>
#include <pngmsg/exceptions.hh>
#include <pngmsg/parse_options.hh>

#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngmsg;

namespace {
    struct warning {
        std::uint64_t offset;
        std::string category;
        std::string message;
    };

    parse_options lenient(std::vector<warning>& sink) {
        parse_options opts;
        opts.strict = false;
        opts.on_warning = [&sink](std::uint64_t offset, std::string_view category, std::string_view message) {
            sink.push_back({offset, std::string(category), std::string(message)});
        };
        return opts;
    }
}

TEST_CASE("chunk iterator") {
    SUBCASE("offsets advance by 12 + length") {
        auto bytes = load_test_data("tiny.png");
        chunk_iterator it(bytes.data(), bytes.size(), 8);

        std::vector<std::uint64_t> offsets;
        std::vector<std::string> ids;
        while (it.has_next()) {
            offsets.push_back(it.current().file_offset);
            ids.push_back(it.current().record->type().to_string());
            it.next();
        }

        const std::vector<std::string> expected_ids{"IHDR", "tEXt", "IDAT", "IEND"};
        const std::vector<std::uint64_t> expected_offsets{8, 33, 67, 93};
        CHECK(it.at_end());
        CHECK(ids == expected_ids);
        CHECK(offsets == expected_offsets);
    }

    SUBCASE("empty range") {
        auto bytes = png_signature();
        chunk_iterator it(bytes.data(), bytes.size(), 8);
        CHECK(it.at_end());
        CHECK_FALSE(it.current().record.has_value());
    }

    SUBCASE("start past the end") {
        auto bytes = png_signature();
        chunk_iterator it(bytes.data(), bytes.size(), 100);
        CHECK(it.at_end());
    }

    SUBCASE("next after end is harmless") {
        auto bytes = raw_chunk(0, "IEND", "", 0xAE426082u);
        chunk_iterator it(bytes.data(), bytes.size(), 0);
        REQUIRE(it.has_next());
        it.next();
        CHECK(it.at_end());
        it.next();
        CHECK(it.at_end());
    }
}

TEST_CASE("lenient parsing") {
    SUBCASE("truncated trailing record fails the parse") {
        auto bytes = load_test_data("tiny.png");
        auto extra = raw_chunk(static_cast<std::uint32_t>(secret_message.size()), "RuSt", secret_message, secret_message_crc);
        bytes.insert(bytes.end(), extra.begin(), extra.begin() + 20);

        std::vector<warning> warnings;
        try {
            png::parse(bytes, lenient(warnings));
            FAIL("Should have thrown exception");
        } catch (const data_length_error& e) {
            CHECK(e.declared() == secret_message.size());
            CHECK(e.available() == 12);
        }
        CHECK(warnings.empty());
    }

    SUBCASE("stray trailing bytes fail the parse") {
        auto bytes = load_test_data("tiny.png");
        bytes.push_back(std::byte(0));
        bytes.push_back(std::byte(0));

        std::vector<warning> warnings;
        try {
            png::parse(bytes, lenient(warnings));
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.code() == parse_errc::no_data_length);
        }
        CHECK(warnings.empty());
    }

    SUBCASE("strict mode rejects the same input") {
        auto bytes = load_test_data("tiny.png");
        bytes.push_back(std::byte(0));
        CHECK_THROWS_AS(png::parse(bytes), parse_error);
    }

    SUBCASE("checksum errors stay fatal") {
        auto bytes = png_signature();
        auto bad = raw_chunk(static_cast<std::uint32_t>(secret_message.size()), "RuSt", secret_message, secret_message_crc + 1);
        bytes.insert(bytes.end(), bad.begin(), bad.end());

        std::vector<warning> warnings;
        CHECK_THROWS_AS(png::parse(bytes, lenient(warnings)), crc_error);
        CHECK(warnings.empty());
    }

    SUBCASE("type code errors stay fatal") {
        auto bytes = png_signature();
        auto bad = raw_chunk(0, "IE1D", "", 0);
        bytes.insert(bytes.end(), bad.begin(), bad.end());

        std::vector<warning> warnings;
        CHECK_THROWS_AS(png::parse(bytes, lenient(warnings)), chunk_type_error);
    }

    SUBCASE("no handler installed") {
        auto bytes = load_test_data("tiny.png");

        parse_options opts;
        opts.strict = false;
        opts.max_chunk_size = 16;
        CHECK(png::parse(bytes, opts).size() == 4);
    }
}

TEST_CASE("chunk size limit") {
    auto bytes = load_test_data("tiny.png");

    SUBCASE("strict") {
        parse_options opts;
        opts.max_chunk_size = 16;
        try {
            png::parse(bytes, opts);
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.code() == parse_errc::chunk_too_large);
            std::string msg = e.what();
            CHECK(msg.find("tEXt") != std::string::npos);
            CHECK(msg.find("offset 33") != std::string::npos);
            CHECK(msg.find("22") != std::string::npos);
        }
    }

    SUBCASE("lenient") {
        std::vector<warning> warnings;
        auto opts = lenient(warnings);
        opts.max_chunk_size = 16;

        auto p = png::parse(bytes, opts);
        CHECK(p.size() == 4);
        REQUIRE(warnings.size() == 1);
        CHECK(warnings[0].category == "size_limit");
        CHECK(warnings[0].offset == 33);
    }

    SUBCASE("declared length beyond the buffer is a length error") {
        auto data = png_signature();
        auto bad = raw_chunk(0xFFFFFFFFu, "ruSt", "abc", 0);
        data.insert(data.end(), bad.begin(), bad.end());
        try {
            png::parse(data);
            FAIL("Should have thrown exception");
        } catch (const data_length_error& e) {
            CHECK(e.declared() == 0xFFFFFFFFu);
            CHECK(e.available() == 7);
        }
    }
}
