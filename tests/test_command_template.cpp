#include <doctest/doctest.h>
#include "zebralink/command_template.hpp"
#include "zebralink/zpl_commands.hpp"

#include <stdexcept>

using namespace zebralink;

TEST_CASE("keyed pattern splits into alternating literal and key segments") {
    const auto& seg = zpl::FieldOrigin.segments();
    REQUIRE(seg.size() == 7);
    CHECK(seg[0] == "^FO");
    CHECK(seg[1] == "x");
    CHECK(seg[2] == ",");
    CHECK(seg[3] == "y");
    CHECK(seg[5] == "z");
    CHECK(seg[6] == "");
}

TEST_CASE("the longest key wins while scanning") {
    const CommandTemplate t("~DYd:f,data", {
        {"d", one_of({"R", "E"}), true},
        {"f", alphanumeric(1, 8), true},
        {"data", text(), true},
    });
    const std::vector<std::string> want = {"~DY", "d", ":", "f", ",", "data", ""};
    CHECK(t.segments() == want);
}

TEST_CASE("zero-argument templates render their literal") {
    CHECK(zpl::StartFormat.segments().size() == 1);
    CHECK(zpl::StartFormat.render_string({}) == "^XA");
    CHECK(zpl::EndFormat.render_string({}) == "^XZ");
}

TEST_CASE("construction rejects keys the pattern does not use, duplicates and null types") {
    CHECK_THROWS_AS(CommandTemplate("^FOx", {{"x", integer_between(0, 1)}, {"y", integer_between(0, 1)}}),
                    std::invalid_argument);
    CHECK_THROWS_AS(CommandTemplate("^FOx,x", {{"x", text()}, {"x", text()}}), std::invalid_argument);
    CHECK_THROWS_AS(CommandTemplate("^FOx", {{"x", nullptr}}), std::invalid_argument);
    CHECK_THROWS_AS(CommandTemplate("^FO", {{"", text()}}), std::invalid_argument);
}

TEST_CASE("unset optional values render empty") {
    CHECK(zpl::FieldOrigin.render_string({{"x", 10}, {"y", 20}}) == "^FO10,20,");
    CHECK(zpl::FieldOrigin.render_string({{"x", 10}, {"y", 20}, {"z", 1}}) == "^FO10,20,1");
}

TEST_CASE("validation collects every failure per key") {
    ValidationError err;
    CHECK_FALSE(zpl::FieldOrigin.validate_params({{"x", "a"}, {"q", 1}}, err));
    CHECK(err.has("x"));
    CHECK(err.has("y"));
    CHECK(err.has("q"));
    CHECK(err.errors().at("q").front() == "unknown parameter");
    CHECK(err.errors().at("y").front() == "required parameter is missing");
    CHECK(err.message() ==
          "invalid parameters for ^FOx,y,z: q (unknown parameter); x (should be a number); "
          "y (required parameter is missing)");
}

TEST_CASE("try_render leaves the output untouched on failure") {
    std::string out = "unchanged";
    ValidationError err;
    CHECK_FALSE(zpl::PrintWidth.try_render_string({{"a", 1}}, out, err));
    CHECK(out == "unchanged");
    CHECK(err.message() == "invalid parameter for ^PWa: a (should be an integer between 2 and 32000)");

    err.clear();
    CHECK(zpl::PrintWidth.try_render_string({{"a", 812}}, out, err));
    CHECK(out == "^PW812");
}

TEST_CASE("flags in boolean-token slots render their tokens") {
    CHECK(zpl::LabelReversePrint.render_string({{"a", true}}) == "^LRY");
    CHECK(zpl::MirrorImage.render_string({{"a", false}}) == "^PMN");
    // ^PO true means inverted
    CHECK(zpl::PrintOrientation.render_string({{"a", true}}) == "^POI");
    CHECK(zpl::PrintOrientation.render_string({{"a", false}}) == "^PON");
}

TEST_CASE("positional templates join parameters with their delimiters") {
    CHECK(zpl::PrintRate.pattern() == "^PRp,s,b");
    CHECK(zpl::PrintRate.render_string({{"p", 2}}) == "^PR2,,");
    CHECK(zpl::PrintRate.render_string({{"p", 2}, {"s", 4}, {"b", 6}}) == "^PR2,4,6");

    ValidationError err;
    CHECK(zpl::PrintRate.validate_params({{"p", "A"}}, err));
    CHECK_FALSE(zpl::PrintRate.validate_params({{"p", 15}}, err));
}

TEST_CASE("bind maps ordered values onto keys in declaration order") {
    ParamValues v;
    ValidationError err;
    CHECK(zpl::PrintRate.bind({3, "A"}, v, err));
    CHECK(v.at("p") == ParamValue(3));
    CHECK(v.at("s") == ParamValue("A"));
    CHECK(v.count("b") == 0);

    ParamValues extra;
    ValidationError err2;
    CHECK_FALSE(zpl::PrintRate.bind({1, 2, 3, 4}, extra, err2));
    CHECK(err2.has("#3"));
    CHECK(err2.errors().at("#3").front() == "unexpected positional value");
}

TEST_CASE("render_bytes splices binary values verbatim") {
    const Bytes payload = {0x00, 0xFF, 0x5E};
    Bytes out;
    ValidationError err;
    REQUIRE(zpl::DownloadObject.try_render_bytes(
        {{"d", "R"}, {"f", "FONT"}, {"b", "B"}, {"x", "T"}, {"t", 3}, {"data", payload}}, out, err));

    const std::string head = "~DYR:FONT,B,T,3,,";
    REQUIRE(out.size() == head.size() + payload.size());
    CHECK(std::string(out.begin(), out.begin() + static_cast<std::ptrdiff_t>(head.size())) == head);
    CHECK(out[head.size()] == 0x00);
    CHECK(out[head.size() + 1] == 0xFF);
    CHECK(out[head.size() + 2] == 0x5E);
}

TEST_CASE("rendering is repeatable") {
    const ParamValues v{{"x", 10}, {"y", 20}, {"z", 0}};
    const std::string once = zpl::FieldOrigin.render_string(v);
    CHECK(zpl::FieldOrigin.render_string(v) == once);
    CHECK(once == "^FO10,20,0");

    const ParamValues d{{"d", "R"}, {"f", "FONT"}, {"b", "B"}, {"x", "T"}, {"t", 2},
                        {"data", Bytes{0x00, 0xFF}}};
    const Bytes first = zpl::DownloadObject.render_bytes(d);
    CHECK(zpl::DownloadObject.render_bytes(d) == first);
}

TEST_CASE("validation starts from a clean error") {
    ValidationError err;
    CHECK_FALSE(zpl::FieldOrigin.validate_params({{"x", "a"}}, err));
    CHECK(err.has("x"));
    CHECK(zpl::FieldOrigin.validate_params({{"x", 1}, {"y", 2}}, err));
    CHECK(err.empty());
}
