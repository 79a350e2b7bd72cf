// ============================================================================
// zpl_commands.cpp - template definitions for zpl_commands.hpp
// ============================================================================

#include "zebralink/zpl_commands.hpp"

namespace zebralink::zpl {

// Shared parameter types. Defined before the templates in this translation
// unit, so they are initialized first.
static const ParamTypePtr kYesNo        = yes_no();
static const ParamTypePtr kOrientations = one_of({"N", "R", "I", "B"});
static const ParamTypePtr kDrives       = one_of({"R", "E", "B", "A"});
static const ParamTypePtr kColors       = one_of({"B", "W"});
static const ParamTypePtr kObjectName   = alphanumeric(1, 8);
static const ParamTypePtr kDots         = integer_between(0, 32000);
static const ParamTypePtr kSpeed14      = any_of({integer_between(1, 14), one_of({"A", "B", "C", "D", "E"})});
static const ParamTypePtr kSpeed2_14    = any_of({integer_between(2, 14), one_of({"A", "B", "C", "D", "E"})});

static constexpr bool REQ = true;
static constexpr bool OPT = false;

// ---- A ---------------------------------------------------------------------

const CommandTemplate ScalableFont("^Afo,h,w", {
  {"f", alphanumeric_of_length(1), REQ, "", "font name"},
  {"o", kOrientations,             OPT, "", "field orientation"},
  {"h", integer_between(10, 32000), OPT, "", "character height (dots)"},
  {"w", integer_between(10, 32000), OPT, "", "width (dots)"},
});

const CommandTemplate BitmappedFont("^Afo,h,w", {
  {"f", alphanumeric_of_length(1), REQ, "", "font name"},
  {"o", kOrientations,             OPT, "", "field orientation"},
  {"h", integer_between(1, 10),    OPT, "", "character height magnification"},
  {"w", integer_between(1, 10),    OPT, "", "width magnification"},
});

const CommandTemplate FontByName("^A@o,h,w,d:f.x", {
  {"o", kOrientations,              OPT, "", "field orientation"},
  {"h", integer_between(10, 32000), OPT, "", "character height (dots)"},
  {"w", integer_between(10, 32000), OPT, "", "width (dots)"},
  {"d", kDrives,                    OPT, "", "drive location of font"},
  {"f", text(),                     OPT, "", "font name"},
  {"x", one_of({"FNT", "TTF", "TTE"}), REQ, "", "extension"},
});

// ---- B ---------------------------------------------------------------------

const CommandTemplate Code128("^BCo,h,f,g,e,m", {
  {"o", kOrientations,             OPT, "", "orientation"},
  {"h", integer_between(1, 32000), OPT, "", "bar code height (dots)"},
  {"f", kYesNo,                    OPT, "", "print interpretation line"},
  {"g", kYesNo,                    OPT, "", "interpretation line above code"},
  {"e", kYesNo,                    OPT, "", "UCC check digit"},
  {"m", one_of({"N", "U", "A", "D"}), OPT, "", "mode"},
});

const CommandTemplate QrCode("^BQa,b,c,d,e", {
  {"a", one_of({"N"}),                OPT, "", "field orientation"},
  {"b", integer_between(1, 2),        OPT, "", "model"},
  {"c", integer_between(1, 10),       OPT, "", "magnification factor"},
  {"d", one_of({"H", "Q", "M", "L"}), OPT, "", "error correction"},
  {"e", integer_between(0, 7),        OPT, "", "mask value"},
});

const CommandTemplate BarCodeDefaults("^BYw,r,h", {
  {"w", integer_between(1, 10),     OPT, "", "module width (dots)"},
  {"r", integer_between(2, 3),      OPT, "", "wide to narrow bar ratio"},
  {"h", integer_between(10, 32000), OPT, "", "bar code height (dots)"},
});

// ---- D ---------------------------------------------------------------------

const CommandTemplate DownloadObject("~DYd:f,b,x,t,w,data", {
  {"d",    kDrives,                      REQ, "", "file location"},
  {"f",    kObjectName,                  REQ, "", "file name"},
  {"b",    one_of({"A", "B", "C", "P"}), REQ, "", "format of the data field"},
  {"x",    one_of({"B", "E", "G", "P", "T", "X", "NRD", "PAC", "C", "F", "H"}), REQ, "", "extension"},
  {"t",    integer_between(0, 9999999),  REQ, "", "total number of bytes in file"},
  {"w",    integer_between(0, 9999999),  OPT, "", "bytes per row (GRF only)"},
  {"data", binary(),                     REQ, "", "data"},
});

// ---- F ---------------------------------------------------------------------

const CommandTemplate FieldBlock("^FBa,b,c,d,e", {
  {"a", integer_between(0, 32000),    OPT, "", "width of text block line (dots)"},
  {"b", integer_between(1, 9999),     OPT, "", "maximum number of lines"},
  {"c", integer_between(-9999, 9999), OPT, "", "line spacing adjustment (dots)"},
  {"d", one_of({"L", "C", "R", "J"}), OPT, "", "text justification"},
  {"e", integer_between(0, 9999),     OPT, "", "hanging indent (dots)"},
});

const CommandTemplate FieldData("^FDa", {
  {"a", text(), REQ, "", "data to be printed"},
});

const CommandTemplate FieldOrigin("^FOx,y,z", {
  {"x", kDots,                 REQ, "", "x-axis location (dots)"},
  {"y", kDots,                 REQ, "", "y-axis location (dots)"},
  {"z", integer_between(0, 2), OPT, "", "justification"},
});

const CommandTemplate FieldParameter("^FPd,g", {
  {"d", one_of({"H", "V", "R"}),  REQ, "", "direction"},
  {"g", integer_between(0, 9999), OPT, "", "inter-character gap (dots)"},
});

const CommandTemplate FieldReversePrint("^FR");
const CommandTemplate FieldSeparator("^FS");

const CommandTemplate FieldVariable("^FVa", {
  {"a", text(), REQ, "", "variable field data"},
});

const CommandTemplate FieldOrientation("^FWr,z", {
  {"r", kOrientations,         REQ, "", "rotate field"},
  {"z", integer_between(0, 2), OPT, "", "justification"},
});

const CommandTemplate Comment("^FXc", {
  {"c", text(), REQ, "", "non printing comment"},
});

// ---- G ---------------------------------------------------------------------

const CommandTemplate GraphicBox("^GBw,h,t,c,r", {
  {"w", integer_between(1, 32000), REQ, "", "box width (dots)"},
  {"h", integer_between(1, 32000), REQ, "", "box height (dots)"},
  {"t", integer_between(1, 32000), REQ, "", "border thickness (dots)"},
  {"c", kColors,                   OPT, "", "line color"},
  {"r", integer_between(0, 8),     OPT, "", "degree of corner rounding"},
});

const CommandTemplate GraphicCircle("^GCd,t,c", {
  {"d", integer_between(3, 4095), REQ, "", "circle diameter (dots)"},
  {"t", integer_between(2, 4095), REQ, "", "border thickness (dots)"},
  {"c", kColors,                  OPT, "", "line color"},
});

const CommandTemplate GraphicDiagonal("^GDw,h,t,c,o", {
  {"w", integer_between(3, 32000), REQ, "", "box width (dots)"},
  {"h", integer_between(3, 32000), REQ, "", "box height (dots)"},
  {"t", integer_between(1, 32000), REQ, "", "border thickness (dots)"},
  {"c", kColors,                   OPT, "", "line color"},
  {"o", one_of({"R", "L"}),        OPT, "", "direction of the diagonal"},
});

const CommandTemplate GraphicEllipse("^GEw,h,t,c", {
  {"w", integer_between(3, 4095), REQ, "", "ellipse width (dots)"},
  {"h", integer_between(3, 4095), REQ, "", "ellipse height (dots)"},
  {"t", integer_between(2, 4095), REQ, "", "border thickness (dots)"},
  {"c", kColors,                  OPT, "", "line color"},
});

// ---- I ---------------------------------------------------------------------

const CommandTemplate ObjectDelete("^IDd:o.x", {
  {"d", kDrives,     OPT, "", "location of stored object"},
  {"o", kObjectName, OPT, "", "object name"},
  {"x", text(),      OPT, "", "extension"},
});

const CommandTemplate ImageLoad("^ILd:o.x", {
  {"d", kDrives,                 OPT, "", "location of stored object"},
  {"o", kObjectName,             OPT, "", "object name"},
  {"x", one_of({"GRF", "PNG"}),  OPT, "", "extension"},
});

const CommandTemplate ImageMove("^IMd:o.x", {
  {"d", kDrives,                 OPT, "", "location of stored object"},
  {"o", kObjectName,             OPT, "", "object name"},
  {"x", one_of({"GRF", "PNG"}),  OPT, "", "extension"},
});

const CommandTemplate ImageSave("^ISd:o.x,p", {
  {"d", kDrives,                 OPT, "", "location of stored object"},
  {"o", kObjectName,             OPT, "", "object name"},
  {"x", one_of({"GRF", "PNG"}),  OPT, "", "extension"},
  {"p", kYesNo,                  OPT, "", "print image after storing"},
});

// ---- L ---------------------------------------------------------------------

const CommandTemplate ListFontLinks("^LF");

const CommandTemplate LabelHome("^LHx,y", {
  {"x", kDots, OPT, "", "x-axis location (dots)"},
  {"y", kDots, OPT, "", "y-axis location (dots)"},
});

const CommandTemplate LabelLength("^LLy", {
  {"y", integer_between(1, 32000), REQ, "", "label length (dots)"},
});

const CommandTemplate LabelReversePrint("^LRa", {
  {"a", kYesNo, REQ, "", "reverse print all fields"},
});

const CommandTemplate LabelShift("^LSa", {
  {"a", integer_between(-9999, 9999), REQ, "", "shift left value (dots)"},
});

const CommandTemplate LabelTop("^LTx", {
  {"x", integer_between(-120, 120), REQ, "", "label top (dot rows)"},
});

// ---- P ---------------------------------------------------------------------

const CommandTemplate SlewToHome("^PH");

const CommandTemplate MirrorImage("^PMa", {
  {"a", kYesNo, REQ, "", "print mirror image of entire label"},
});

const CommandTemplate PrintOrientation("^POa", {
  {"a", boolean_tokens("I", "N"), REQ, "", "invert label 180 degrees"},
});

const CommandTemplate ProgrammablePause("^PP");

const CommandTemplate PrintQuantity("^PQq,p,r,o,e", {
  {"q", integer_between(1, 99999999), REQ, "", "total quantity of labels"},
  {"p", integer_between(0, 99999999), OPT, "", "labels between pauses"},
  {"r", integer_between(0, 99999999), OPT, "", "replicates of each serial number"},
  {"o", kYesNo,                       OPT, "", "override pause count"},
  {"e", kYesNo,                       OPT, "", "cut on error label"},
});

const CommandTemplate PrintRate = CommandTemplate::positional("^PR", {
  {"p", kSpeed14,   REQ, "", "print speed"},
  {"s", kSpeed2_14, OPT, "", "slew speed"},
  {"b", kSpeed2_14, OPT, "", "backfeed speed"},
});

const CommandTemplate PrintWidth("^PWa", {
  {"a", integer_between(2, 32000), REQ, "", "label width (dots)"},
});

const CommandTemplate PrintStart("~PS");

// ---- W ---------------------------------------------------------------------

const CommandTemplate ConfigurationLabel("~WC");

const CommandTemplate DirectoryLabel("^WDd:o.x", {
  {"d", one_of({"R", "E", "B", "A", "Z"}), OPT, "", "source device"},
  {"o", any_of({kObjectName, one_of({"*", "?"})}), OPT, "", "object name"},
  {"x", one_of({"FNT", "BAR", "ZPL", "GRF", "CO", "DAT", "BAS", "BAE", "STO",
                "PNG", "TTF", "TTE", "*", "?"}), OPT, "", "extension"},
});

// ---- X ---------------------------------------------------------------------

const CommandTemplate StartFormat("^XA");

const CommandTemplate RecallFormat("^XFd:o.x", {
  {"d", kDrives,        REQ, "", "source device of stored format"},
  {"o", kObjectName,    REQ, "", "name of stored format"},
  {"x", one_of({"ZPL"}), REQ, "", "extension"},
});

const CommandTemplate RecallGraphic("^XGd:o.x,mx,my", {
  {"d",  kDrives,               REQ, "", "source device of stored image"},
  {"o",  kObjectName,           REQ, "", "name of stored image"},
  {"x",  one_of({"GRF"}),       REQ, "", "extension"},
  {"mx", integer_between(1, 10), OPT, "", "magnification on the x-axis"},
  {"my", integer_between(1, 10), OPT, "", "magnification on the y-axis"},
});

const CommandTemplate EndFormat("^XZ");

} // namespace zebralink::zpl
