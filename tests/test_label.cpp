#include <doctest/doctest.h>
#include "zebralink/command_set.hpp"
#include "zebralink/label.hpp"
#include "zebralink/zpl_commands.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

using namespace zebralink;

TEST_CASE("CommandSet stores only validated entries and renders them in order") {
    CommandSet cs;
    ValidationError err;
    CHECK(cs.append(zpl::StartFormat));
    CHECK(cs.append(zpl::FieldOrigin, {{"x", 5}, {"y", 6}}));
    CHECK_FALSE(cs.append(zpl::FieldOrigin, {{"x", -1}, {"y", 6}}, &err));
    CHECK(err.has("x"));
    CHECK(cs.append(zpl::EndFormat));
    CHECK(cs.size() == 3);
    CHECK(cs.render_string() == "^XA^FO5,6,^XZ");
    CHECK(to_string(cs.render_bytes()) == cs.render_string());
}

TEST_CASE("empty label renders start and end only") {
    Label l;
    CHECK(l.render_string() == "^XA^XZ");
}

TEST_CASE("text emits field orientation only when it changes") {
    Label l;
    REQUIRE(l.text(20, 20, "hello"));
    CHECK(l.render_string() == "^XA^FO20,20,0^FWN,0^FDhello^FS^XZ");
    CHECK(l.last_orientation() == Orientation::Normal);

    REQUIRE(l.text(20, 60, "again"));
    TextOptions rot;
    rot.orientation = Orientation::TopDown;
    REQUIRE(l.text(20, 100, "turned", rot));
    CHECK(l.render_string() ==
          "^XA^FO20,20,0^FWN,0^FDhello^FS"
          "^FO20,60,0^FDagain^FS"
          "^FO20,100,0^FWR,0^FDturned^FS^XZ");
}

TEST_CASE("text with a font uses ^A and square sizing when one side is given") {
    Label l;
    TextOptions o;
    o.font = TextFont{"0", 30.0, std::nullopt};
    o.invert = true;
    REQUIRE(l.text(10, 10, "big", o));
    CHECK(l.render_string() == "^XA^FO10,10,0^FR^A0N,30,30^FDbig^FS^XZ");
    CHECK_FALSE(l.last_orientation().has_value());
}

TEST_CASE("a rejected element leaves the label untouched") {
    Label l;
    REQUIRE(l.text(0, 0, "keep"));
    const std::string before = l.render_string();

    TextOptions o;
    o.font = TextFont{"AB", 30.0, 40.0};
    ValidationError err;
    CHECK_FALSE(l.text(0, 50, "drop", o, &err));
    CHECK(err.has("f"));
    CHECK(l.render_string() == before);
}

TEST_CASE("axis-aligned lines become boxes no thinner than the stroke") {
    Label l;
    LineOptions o;
    o.thickness = 3;
    REQUIRE(l.line(0, 0, 100, 0, o));
    REQUIRE(l.line(50, 80, 50, 10));
    CHECK(l.render_string() ==
          "^XA^FO0,0,0^GB100,3,3,B,0^FS^FO50,10,0^GB1,70,1,B,0^FS^XZ");
}

TEST_CASE("diagonal lines pick their lean from the direction of travel") {
    Label down;
    REQUIRE(down.line(10, 10, 110, 60));
    CHECK(down.render_string() == "^XA^FO10,10,0^GD100,50,1,B,L^FS^XZ");

    Label up;
    REQUIRE(up.line(10, 60, 110, 10));
    CHECK(up.render_string() == "^XA^FO10,10,0^GD100,50,1,B,R^FS^XZ");
}

TEST_CASE("boxes: border thickness or fully filled") {
    Label l;
    REQUIRE(l.box(10, 10, 50, 20));
    BoxOptions filled;
    filled.filled = true;
    filled.color = LineColor::White;
    REQUIRE(l.box(10, 40, 50, 20, filled));
    CHECK(l.render_string() ==
          "^XA^FO10,10,0^GB50,20,1,B,0^FS^FO10,40,0^GB50,20,20,W,0^FS^XZ");

    BoxOptions round;
    round.corner_rounding = 9;
    ValidationError err;
    CHECK_FALSE(l.box(0, 0, 10, 10, round, &err));
    CHECK(err.has("r"));
}

TEST_CASE("ellipses: circles use ^GC, centred by default") {
    Label l;
    REQUIRE(l.ellipse(100, 100, 50, 50));
    EllipseOptions tl;
    tl.positioning = Positioning::TopLeft;
    REQUIRE(l.ellipse(10, 10, 80, 40, tl));
    CHECK(l.render_string() ==
          "^XA^FO75,75,0^GC50,2,B^FS^FO10,10,0^GE80,40,2,B^FS^XZ");
}

TEST_CASE("qr codes: manual mode, origin raised by the quiet zone") {
    Label l;
    REQUIRE(l.qrcode(50, 50, "12345"));
    CHECK(l.render_string() == "^XA^FO50,40,0^BQ,2,,Q,^FDQM,N12345^FS^XZ");
}

TEST_CASE("qr codes: byte data with a target size picks a magnification") {
    Label l;
    QrOptions o;
    o.max_size = 100.0;
    REQUIRE(l.qrcode(0, 30, "hello world", o));
    // 11 bytes fit version 1 at level Q: 100 / 21 -> 4
    CHECK(l.render_string() == "^XA^FO0,20,0^BQ,2,4,Q,^FDQM,B0011hello world^FS^XZ");
}

TEST_CASE("qr codes: automatic mode and a clamped origin") {
    Label l;
    QrOptions o;
    o.auto_mode = true;
    o.level = QrLevel::H;
    o.mask = 3;
    o.max_size = 500.0;
    REQUIRE(l.qrcode(0, 4, "ABC", o));
    CHECK(l.render_string() == "^XA^FO0,0,0^BQ,2,,H,3^FDHA,ABC^FS^XZ");
}

TEST_CASE("page setup converts inches to dots") {
    LabelOptions opts;
    opts.unit = Unit::Inches;
    opts.dpi = 203.0;
    opts.width = 4.0;
    opts.height = 6.0;
    Label l(opts);
    REQUIRE(l.text(0.5, 0.25, "x"));
    // 101.5 rounds away from zero
    CHECK(l.render_string() == "^XA^PW812^LL1218^FO102,51,0^FWN,0^FDx^FS^XZ");
}

TEST_CASE("construction rejects unusable options") {
    LabelOptions no_dpi;
    no_dpi.unit = Unit::Pixels;
    CHECK_THROWS_AS(Label{no_dpi}, std::invalid_argument);

    LabelOptions too_wide;
    too_wide.width = 40000.0;
    CHECK_THROWS_AS(Label{too_wide}, std::invalid_argument);
}

TEST_CASE("print setup, comments and stored images") {
    Label l;
    REQUIRE(l.print_rate(2));
    REQUIRE(l.print_rate("A", ParamValue(4), ParamValue("C")));
    REQUIRE(l.print_quantity(3));
    REQUIRE(l.comment("batch 7"));
    REQUIRE(l.image(10, 10, 'R', "LOGO", "PNG"));
    CHECK(l.render_string() ==
          "^XA^PR2,,^PRA,4,C^PQ3,,,,^FXbatch 7^FO10,10,0^IMR:LOGO.PNG^FS^XZ");
    CHECK(to_string(l.render_bytes()) == l.render_string());

    ValidationError err;
    CHECK_FALSE(l.print_rate("Z", std::nullopt, std::nullopt, &err));
    CHECK(err.has("p"));
    CHECK_FALSE(l.print_quantity(0));
}

TEST_CASE("coordinates that do not convert to whole dots fail the element") {
    Label l;
    ValidationError err;
    CHECK_FALSE(l.box(4294967396.0, 0, 10, 10, {}, &err));
    CHECK(err.has("x"));

    CHECK_FALSE(l.text(std::nan(""), 5, "hi", {}, &err));
    CHECK(err.has("x"));
    CHECK(err.message() == "invalid parameter: x (should be a finite number of dots)");

    CHECK_FALSE(l.line(0, 0, 10, std::numeric_limits<double>::infinity(), {}, &err));
    CHECK(err.has("y2"));

    QrOptions qo;
    qo.max_size = std::nan("");
    CHECK_FALSE(l.qrcode(0, 0, "x", qo, &err));
    CHECK(err.has("max_size"));

    CHECK(l.render_string() == "^XA^XZ");
    CHECK_FALSE(l.last_orientation().has_value());

    LabelOptions lo;
    lo.width = std::nan("");
    CHECK_THROWS_AS(Label{lo}, std::invalid_argument);
}

TEST_CASE("one error object can be reused across calls") {
    Label l;
    ValidationError err;
    CHECK_FALSE(l.box(-5, 0, 10, 10, {}, &err));
    CHECK_FALSE(err.empty());
    CHECK(l.box(5, 0, 10, 10, {}, &err));
    CHECK(err.empty());
}

TEST_CASE("rendering a label twice gives the same output") {
    Label l;
    REQUIRE(l.text(10, 10, "again"));
    REQUIRE(l.box(0, 0, 50, 20));
    const std::string first = l.render_string();
    CHECK(l.render_string() == first);
    const Bytes bytes = l.render_bytes();
    CHECK(l.render_bytes() == bytes);
    CHECK(to_string(bytes) == first);
}
