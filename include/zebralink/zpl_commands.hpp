#pragma once
/**
 * @file zpl_commands.hpp
 * @brief Catalog of ZPL command templates used by zebralink.
 *
 * @details
 * One shared, read-only CommandTemplate per ZPL command. Parameter ranges
 * follow the ZPL II programming guide. Names drop the ZPL prefix and read as
 * what the command does; the template pattern is the wire shape.
 *
 * Templates are defined in zpl_commands.cpp at namespace scope. Use them from
 * code that runs after static initialization (any function body is fine).
 */

#include "zebralink/command_template.hpp"

namespace zebralink::zpl {

// ---- A: fonts --------------------------------------------------------------
extern const CommandTemplate ScalableFont;      // ^Afo,h,w    h/w 10..32000
extern const CommandTemplate BitmappedFont;     // ^Afo,h,w    h/w 1..10 (magnification)
extern const CommandTemplate FontByName;        // ^A@o,h,w,d:f.x

// ---- B: bar codes ----------------------------------------------------------
extern const CommandTemplate Code128;           // ^BCo,h,f,g,e,m
extern const CommandTemplate QrCode;            // ^BQa,b,c,d,e
extern const CommandTemplate BarCodeDefaults;   // ^BYw,r,h

// ---- D: download -----------------------------------------------------------
extern const CommandTemplate DownloadObject;    // ~DYd:f,b,x,t,w,data

// ---- F: fields -------------------------------------------------------------
extern const CommandTemplate FieldBlock;        // ^FBa,b,c,d,e
extern const CommandTemplate FieldData;         // ^FDa
extern const CommandTemplate FieldOrigin;       // ^FOx,y,z
extern const CommandTemplate FieldParameter;    // ^FPd,g
extern const CommandTemplate FieldReversePrint; // ^FR
extern const CommandTemplate FieldSeparator;    // ^FS
extern const CommandTemplate FieldVariable;     // ^FVa
extern const CommandTemplate FieldOrientation;  // ^FWr,z
extern const CommandTemplate Comment;           // ^FXc

// ---- G: graphics -----------------------------------------------------------
extern const CommandTemplate GraphicBox;        // ^GBw,h,t,c,r
extern const CommandTemplate GraphicCircle;     // ^GCd,t,c
extern const CommandTemplate GraphicDiagonal;   // ^GDw,h,t,c,o
extern const CommandTemplate GraphicEllipse;    // ^GEw,h,t,c

// ---- I: stored objects -----------------------------------------------------
extern const CommandTemplate ObjectDelete;      // ^IDd:o.x
extern const CommandTemplate ImageLoad;         // ^ILd:o.x
extern const CommandTemplate ImageMove;         // ^IMd:o.x
extern const CommandTemplate ImageSave;         // ^ISd:o.x,p

// ---- L: label --------------------------------------------------------------
extern const CommandTemplate ListFontLinks;     // ^LF
extern const CommandTemplate LabelHome;         // ^LHx,y
extern const CommandTemplate LabelLength;       // ^LLy
extern const CommandTemplate LabelReversePrint; // ^LRa
extern const CommandTemplate LabelShift;        // ^LSa
extern const CommandTemplate LabelTop;          // ^LTx

// ---- P: printing -----------------------------------------------------------
extern const CommandTemplate SlewToHome;        // ^PH
extern const CommandTemplate MirrorImage;       // ^PMa
extern const CommandTemplate PrintOrientation;  // ^POa  (true = inverted)
extern const CommandTemplate ProgrammablePause; // ^PP
extern const CommandTemplate PrintQuantity;     // ^PQq,p,r,o,e
extern const CommandTemplate PrintRate;         // ^PRp,s,b (positional)
extern const CommandTemplate PrintWidth;        // ^PWa
extern const CommandTemplate PrintStart;        // ~PS

// ---- W: directory / configuration -----------------------------------------
extern const CommandTemplate ConfigurationLabel; // ~WC
extern const CommandTemplate DirectoryLabel;     // ^WDd:o.x

// ---- X: format -------------------------------------------------------------
extern const CommandTemplate StartFormat;       // ^XA
extern const CommandTemplate RecallFormat;      // ^XFd:o.x
extern const CommandTemplate RecallGraphic;     // ^XGd:o.x,mx,my
extern const CommandTemplate EndFormat;         // ^XZ

} // namespace zebralink::zpl
