#include <catch2/catch_test_macros.hpp>
#include "io/text_stream.hpp"
#include "fixtures.hpp"

using namespace kmp;
using io::Encoding;

namespace {

io::TextStream text_over(std::string bytes, Encoding encoding, size_t chunk = 4096) {
    return io::TextStream(std::make_unique<test::MemoryStream>(std::move(bytes), chunk),
                          encoding);
}

std::vector<std::string> all_lines(io::TextStream& text) {
    std::vector<std::string> lines;
    std::string line;
    while (true) {
        auto more = text.read_line(line);
        REQUIRE(more.ok());
        if (!more.value()) break;
        lines.push_back(line);
    }
    return lines;
}

} // namespace

TEST_CASE("Encoding names", "[text]") {
    CHECK(io::parse_encoding("utf-8").value() == Encoding::Utf8);
    CHECK(io::parse_encoding("UTF8").value() == Encoding::Utf8);
    CHECK(io::parse_encoding("utf_8_sig").value() == Encoding::Utf8Sig);
    CHECK(io::parse_encoding("ascii").value() == Encoding::Ascii);
    CHECK(io::parse_encoding("Latin-1").value() == Encoding::Latin1);
    CHECK(io::parse_encoding("iso-8859-1").value() == Encoding::Latin1);

    auto unknown = io::parse_encoding("ebcdic");
    REQUIRE_FALSE(unknown.ok());
    CHECK(unknown.error().kind == ErrorKind::InvalidArgument);
}

TEST_CASE("UTF-8 validation", "[text]") {
    CHECK(io::decode("plain", Encoding::Utf8).value() == "plain");
    CHECK(io::decode("caf\xC3\xA9", Encoding::Utf8).value() == "caf\xC3\xA9");
    CHECK(io::decode("\xF0\x9F\x98\x80", Encoding::Utf8).ok());

    CHECK(io::decode("\xFF", Encoding::Utf8).error().kind == ErrorKind::DecodeError);
    // Truncated sequence
    CHECK_FALSE(io::decode("caf\xC3", Encoding::Utf8).ok());
    // Overlong '/'
    CHECK_FALSE(io::decode("\xC0\xAF", Encoding::Utf8).ok());
    // Encoded surrogate
    CHECK_FALSE(io::decode("\xED\xA0\x80", Encoding::Utf8).ok());
}

TEST_CASE("Decode errors report the stream offset", "[text]") {
    auto result = io::decode("ab\xFF", Encoding::Utf8, 100);
    REQUIRE_FALSE(result.ok());
    CHECK(result.error().message.find("102") != std::string::npos);
}

TEST_CASE("ASCII and Latin-1 decoding", "[text]") {
    CHECK(io::decode("abc", Encoding::Ascii).value() == "abc");
    CHECK(io::decode("ab\xE9", Encoding::Ascii).error().kind == ErrorKind::DecodeError);
    CHECK(io::decode("caf\xE9", Encoding::Latin1).value() == "caf\xC3\xA9");
    CHECK(io::decode("\xFF", Encoding::Latin1).value() == "\xC3\xBF");
}

TEST_CASE("Text stream splits lines", "[text]") {
    auto text = text_over("alpha\r\nbeta\n\ngamma", Encoding::Utf8);
    CHECK(all_lines(text) == std::vector<std::string>{"alpha", "beta", "", "gamma"});
}

TEST_CASE("Text stream lines across small reads", "[text]") {
    auto text = text_over("caf\xC3\xA9\r\nna\xC3\xAFve\n", Encoding::Utf8, 1);
    CHECK(all_lines(text) == std::vector<std::string>{"caf\xC3\xA9", "na\xC3\xAFve"});
}

TEST_CASE("Text stream read_all normalizes CRLF", "[text]") {
    auto text = text_over("a\r\nb\r\nc\rd", Encoding::Utf8);
    auto all = text.read_all();
    REQUIRE(all.ok());
    CHECK(all.value() == "a\nb\nc\rd");
}

TEST_CASE("Text stream reports the missing final newline", "[text]") {
    auto text = text_over("one\r\ntwo", Encoding::Utf8);
    std::string line;

    REQUIRE(text.read_line(line).value());
    CHECK(line == "one");
    CHECK(text.line_terminated());

    REQUIRE(text.read_line(line).value());
    CHECK(line == "two");
    CHECK_FALSE(text.line_terminated());

    CHECK_FALSE(text.read_line(line).value());
}

TEST_CASE("A lone carriage return at end of stream is kept", "[text]") {
    auto text = text_over("abc\r", Encoding::Utf8, 2);
    CHECK(all_lines(text) == std::vector<std::string>{"abc\r"});
    CHECK_FALSE(text.line_terminated());

    auto crlf = text_over("abc\r\n", Encoding::Utf8, 2);
    std::string line;
    REQUIRE(crlf.read_line(line).value());
    CHECK(line == "abc");
    CHECK(crlf.line_terminated());
}

TEST_CASE("Byte order mark handling", "[text]") {
    const std::string bytes = "\xEF\xBB\xBFhello\n";

    auto sig = text_over(bytes, Encoding::Utf8Sig, 2);
    CHECK(all_lines(sig) == std::vector<std::string>{"hello"});

    // Plain utf-8 keeps the mark as U+FEFF
    auto plain = text_over(bytes, Encoding::Utf8);
    CHECK(plain.read_all().value() == bytes);

    auto no_bom = text_over("hello", Encoding::Utf8Sig);
    CHECK(no_bom.read_all().value() == "hello");
}

TEST_CASE("Invalid bytes fail the line that holds them", "[text]") {
    auto text = text_over("good\nbad \xFF\n", Encoding::Utf8);
    std::string line;

    auto first = text.read_line(line);
    REQUIRE(first.ok());
    CHECK(line == "good");

    auto second = text.read_line(line);
    REQUIRE_FALSE(second.ok());
    CHECK(second.error().kind == ErrorKind::DecodeError);
}

TEST_CASE("Empty text stream", "[text]") {
    auto text = text_over("", Encoding::Utf8);
    std::string line;
    auto more = text.read_line(line);
    REQUIRE(more.ok());
    CHECK_FALSE(more.value());
}
