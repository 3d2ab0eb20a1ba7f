#include <catch2/catch_test_macros.hpp>
#include "journal.hpp"
#include <string>
#include <vector>

using namespace sjournal;

namespace
{

std::string le64(uint64_t v)
{
    std::string out;
    for (int i = 0; i < 8; ++i) { out.push_back(static_cast<char>((v >> (8 * i)) & 0xff)); }
    return out;
}

} // namespace

TEST_CASE("Field encoding layout", "[field]")
{
    SECTION("Name, newline, length, value, newline")
    {
        std::string expected = std::string("FOO\n") + le64(3) + "bar\n";
        REQUIRE(encode_field("FOO", "bar") == expected);
    }

    SECTION("Empty value still carries a zero length")
    {
        std::string expected = std::string("EMPTY\n") + le64(0) + "\n";
        REQUIRE(encode_field("EMPTY", "") == expected);
    }

    SECTION("Size matches encoded_field_size")
    {
        REQUIRE(encode_field("MESSAGE", "hello").size() == encoded_field_size("MESSAGE", "hello"));
        REQUIRE(encoded_field_size("A", "") == 11);
        static_assert(encoded_field_size("AB", "cd") == 14);
    }

    SECTION("append_field concatenates")
    {
        std::string record;
        append_field(record, "A", "1");
        append_field(record, "B", "2");
        REQUIRE(record == encode_field("A", "1") + encode_field("B", "2"));
    }
}

TEST_CASE("Values are carried byte for byte", "[field]")
{
    std::string value = "line one\nline two";
    value.push_back('\0');
    value.push_back(static_cast<char>(0xff));
    value += "=tail";

    auto fields = decode_record(encode_field("MESSAGE", value));
    REQUIRE(fields.has_value());
    REQUIRE(fields->size() == 1);
    REQUIRE((*fields)[0].name == "MESSAGE");
    REQUIRE((*fields)[0].value == value);
}

TEST_CASE("Record decoding", "[field]")
{
    SECTION("Several binary fields keep their order")
    {
        std::string record = encode_field("PRIORITY", "6") + encode_field("FOO", "bar") + encode_field("MESSAGE", "x");
        auto fields        = decode_record(record);
        REQUIRE(fields.has_value());
        REQUIRE(*fields == std::vector<journal_field>{{"PRIORITY", "6"}, {"FOO", "bar"}, {"MESSAGE", "x"}});
    }

    SECTION("Text form NAME=value")
    {
        auto fields = decode_record("PRIORITY=3\nMESSAGE=hello=world\n");
        REQUIRE(fields.has_value());
        REQUIRE(find_field(*fields, "PRIORITY") == "3");
        REQUIRE(find_field(*fields, "MESSAGE") == "hello=world");
    }

    SECTION("Mixed forms")
    {
        auto fields = decode_record(std::string("A=1\n") + encode_field("B", "two\nlines"));
        REQUIRE(fields.has_value());
        REQUIRE(find_field(*fields, "A") == "1");
        REQUIRE(find_field(*fields, "B") == "two\nlines");
    }

    SECTION("Empty record has no fields")
    {
        auto fields = decode_record("");
        REQUIRE(fields.has_value());
        REQUIRE(fields->empty());
    }

    SECTION("find_field and count_field")
    {
        auto fields = decode_record(encode_field("X", "1") + encode_field("X", "2"));
        REQUIRE(fields.has_value());
        REQUIRE(find_field(*fields, "X") == "1");
        REQUIRE(count_field(*fields, "X") == 2);
        REQUIRE(count_field(*fields, "Y") == 0);
        REQUIRE_FALSE(find_field(*fields, "Y").has_value());
    }
}

TEST_CASE("Malformed records are rejected", "[field]")
{
    std::string good = encode_field("MESSAGE", "hello");

    SECTION("Missing trailing newline") { REQUIRE_FALSE(decode_record(good.substr(0, good.size() - 1)).has_value()); }

    SECTION("Truncated length") { REQUIRE_FALSE(decode_record(std::string("MESSAGE\n") + std::string("\x05\x00", 2)).has_value()); }

    SECTION("Length past the end")
    {
        REQUIRE_FALSE(decode_record(std::string("MESSAGE\n") + le64(100) + "short\n").has_value());
    }

    SECTION("Wrong terminator after the value")
    {
        std::string bad = good;
        bad.back()      = 'x';
        REQUIRE_FALSE(decode_record(bad).has_value());
    }

    SECTION("Text line without newline") { REQUIRE_FALSE(decode_record("A=1").has_value()); }
}
