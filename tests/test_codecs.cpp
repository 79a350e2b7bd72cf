#include <doctest/doctest.h>
#include "zebralink/bytes.hpp"
#include "zebralink/crc.hpp"
#include "zebralink/encodings.hpp"
#include "zebralink/sgd.hpp"
#include "zebralink/units.hpp"

using namespace zebralink;

TEST_CASE("crc32 check values") {
    CHECK(crc32(to_bytes("123456789")) == 0xCBF43926u);
    CHECK(crc32(to_bytes("IEND")) == 0xAE426082u);
    CHECK(crc32(Bytes{}) == 0u);
}

TEST_CASE("crc16 ccitt (X-25) check value") {
    CHECK(crc16_ccitt(to_bytes("123456789")) == 0x906E);
}

TEST_CASE("generic table matches the dedicated crc32") {
    const Bytes b = to_bytes("zebralink");
    const CrcTable t = make_crc_table(CRC32_POLYNOMIAL);
    CHECK(t == crc32_table());
    CHECK(crc_compute(t, b.data(), b.size()) == crc32(b));
}

TEST_CASE("adler32") {
    CHECK(adler32(to_bytes("Wikipedia")) == 0x11E60398u);
    CHECK(adler32(Bytes{}) == 1u);
}

TEST_CASE("hex is lower case and round trips upper case input") {
    CHECK(to_hex(Bytes{0x00, 0xAB, 0x7F}) == "00ab7f");

    Bytes out;
    CHECK(from_hex("00AB7f", out));
    CHECK(out == Bytes{0x00, 0xAB, 0x7F});
    CHECK_FALSE(from_hex("abc", out));
    CHECK(out.empty());
    CHECK_FALSE(from_hex("zz", out));
}

TEST_CASE("base64 pads to a multiple of four") {
    CHECK(to_base64(to_bytes("Man")) == "TWFu");
    CHECK(to_base64(to_bytes("Ma")) == "TWE=");
    CHECK(to_base64(to_bytes("M")) == "TQ==");
    CHECK(to_base64(Bytes{}) == "");
}

TEST_CASE("byte helpers") {
    const Bytes b = {0x12, 0x34, 0x56, 0x78};
    CHECK(read_u32_be(b.data()) == 0x12345678u);
    CHECK(read_u16_be(b.data() + 2) == 0x5678);

    Bytes out;
    append_u32_be(out, 0xDEADBEEFu);
    CHECK(out == Bytes{0xDE, 0xAD, 0xBE, 0xEF});

    const Bytes a = to_bytes("ab");
    const Bytes c = to_bytes("cd");
    CHECK(to_string(concat({&a, &c})) == "abcd");
}

TEST_CASE("unit conversion") {
    CHECK(to_dots(2.0, Unit::Inches, 203) == doctest::Approx(406.0));
    CHECK(to_dots(96.0, Unit::Pixels, 300) == doctest::Approx(300.0));
    CHECK(to_dots(17.0, Unit::Dots, 0) == doctest::Approx(17.0));
    CHECK(from_dots(406.0, Unit::Inches, 203) == doctest::Approx(2.0));
    CHECK(from_dots(300.0, Unit::Pixels, 300) == doctest::Approx(96.0));

    CHECK(parse_unit("in") == Unit::Inches);
    CHECK(parse_unit("px") == Unit::Pixels);
    CHECK(parse_unit("dots") == Unit::Dots);
    CHECK_FALSE(parse_unit("mm").has_value());
    CHECK(std::string(unit_name(Unit::Inches)) == "in");
}

TEST_CASE("sgd command lines") {
    CHECK(SgdCommand{SgdVerb::Getvar, "device.languages", "ignored"}.to_string() ==
          "! U1 getvar \"device.languages\"\r\n");
    CHECK(SgdCommand{SgdVerb::Setvar, "device.languages", "zpl"}.to_string() ==
          "! U1 setvar \"device.languages\" \"zpl\"\r\n");
    CHECK(SgdCommand{SgdVerb::Do, "device.reset", ""}.to_string() ==
          "! U1 do \"device.reset\" \"\"\r\n");

    CHECK(parse_sgd_verb("do") == SgdVerb::Do);
    CHECK_FALSE(parse_sgd_verb("GETVAR").has_value());
}
