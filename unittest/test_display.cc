#include <doctest/doctest.h>
#include <pngme/chunk.hh>

#include <sstream>

#include "test_utils.hh"

using namespace pngme;

TEST_CASE("chunk rendering") {
    SUBCASE("text payload") {
        chunk c(chunk_type::from_string("RuSt"), bytes_of("hello"));
        CHECK(c.to_string() == "chunk 'RuSt' length=5 crc=0x2ca10fcc data=\"hello\"");
    }

    SUBCASE("empty payload") {
        chunk c(chunk_type::from_string("IEND"), {});
        CHECK(c.to_string() == "chunk 'IEND' length=0 crc=0xae426082 data=\"\"");
    }

    SUBCASE("binary payload") {
        chunk c(chunk_type::from_string("ruSt"), {std::byte(0), std::byte(1), std::byte(2), std::byte(0xFF)});
        CHECK(c.to_string() == "chunk 'ruSt' length=4 crc=0xadb96d66 data=<00 01 02 ff>");
    }

    SUBCASE("escapes in text") {
        chunk c(chunk_type::from_string("RuSt"), bytes_of("a\"b\\c\nd\te"));
        auto s = c.to_string();
        CHECK(s.find("data=\"a\\\"b\\\\c\\nd\\te\"") != std::string::npos);
    }

    SUBCASE("long payload is cut") {
        chunk c(chunk_type::from_string("RuSt"), bytes_of(std::string(100, 'x')));
        auto s = c.to_string();
        CHECK(s.find("data=\"" + std::string(64, 'x') + "\"...") != std::string::npos);
        CHECK(s.find(std::string(65, 'x')) == std::string::npos);
    }

    SUBCASE("cut does not split a multi-byte character") {
        // 63 ASCII bytes then a 2 byte character straddling the 64 byte boundary
        std::string text(63, 'a');
        text += "\xC3\xA9";
        text += "tail";
        chunk c(chunk_type::from_string("RuSt"), bytes_of(text));
        auto s = c.to_string();
        CHECK(s.find("data=\"" + std::string(63, 'a') + "\"...") != std::string::npos);
    }

    SUBCASE("C1 control characters render as hex") {
        // U+009B is the single byte CSI of an ANSI escape sequence
        chunk c(chunk_type::from_string("RuSt"), bytes_of("a\xC2\x9B" "2J"));
        auto s = c.to_string();
        CHECK(s.find("data=<61 c2 9b 32 4a>") != std::string::npos);
        CHECK(s.find("\"a") == std::string::npos);

        // U+00A0 and above are printable
        chunk nbsp(chunk_type::from_string("RuSt"), bytes_of("a\xC2\xA0" "b"));
        CHECK(nbsp.to_string().find("data=\"a\xC2\xA0" "b\"") != std::string::npos);
    }

    SUBCASE("stream output matches to_string") {
        chunk c(chunk_type::from_string("RuSt"), bytes_of(secret_message));
        std::ostringstream os;
        os << c;
        CHECK(os.str() == c.to_string());
        CHECK(os.str().find("length=42") != std::string::npos);
        CHECK(os.str().find("crc=0xabd1d84e") != std::string::npos);
    }
}
