#include <doctest/doctest.h>
#include "zebralink/crc.hpp"
#include "zebralink/png.hpp"

using namespace zebralink;

namespace {

const Bytes SIGNATURE = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};

void add_chunk(Bytes& png, const std::string& type, const Bytes& data) {
    append_u32_be(png, static_cast<uint32_t>(data.size()));
    Bytes td = to_bytes(type);
    td.insert(td.end(), data.begin(), data.end());
    png.insert(png.end(), td.begin(), td.end());
    append_u32_be(png, crc32(td));
}

Bytes ihdr(uint32_t w, uint32_t h) {
    Bytes d;
    append_u32_be(d, w);
    append_u32_be(d, h);
    d.insert(d.end(), {8, 6, 0, 0, 0});
    return d;
}

Bytes minimal_png() {
    Bytes png = SIGNATURE;
    add_chunk(png, "IHDR", ihdr(2, 3));
    add_chunk(png, "IDAT", {0x78, 0x9C});
    add_chunk(png, "IEND", {});
    return png;
}

} // namespace

TEST_CASE("signature sniffing") {
    CHECK(is_png(minimal_png()));
    CHECK_FALSE(is_png(Bytes{0x89, 0x50}));
    CHECK(is_jpeg(Bytes{0xFF, 0xD8, 0xFF, 0xE0, 0x00}));
    CHECK_FALSE(is_jpeg(minimal_png()));
}

TEST_CASE("minimal image parses into three verified chunks") {
    std::vector<PngChunk> chunks;
    REQUIRE(parse_png(minimal_png(), chunks) == PngStatus::Ok);
    REQUIRE(chunks.size() == 3);

    CHECK(chunks[0].type == "IHDR");
    CHECK(chunks[0].critical);
    CHECK(chunks[0].is_public);
    CHECK(chunks[0].recognized);
    CHECK(chunks[0].crc_matched);
    CHECK(chunks[2].type == "IEND");
    CHECK(chunks[2].crc == 0xAE426082u);

    const IhdrInfo* h = png_header(chunks);
    REQUIRE(h != nullptr);
    CHECK(h->width == 2);
    CHECK(h->height == 3);
    CHECK(h->bit_depth == 8);
    CHECK(h->color_type == 6);
}

TEST_CASE("ancillary chunks decode their details") {
    Bytes png = SIGNATURE;
    add_chunk(png, "IHDR", ihdr(1, 1));
    add_chunk(png, "gAMA", {0x00, 0x00, 0xB1, 0x8F});
    add_chunk(png, "sRGB", {0x00});
    add_chunk(png, "pHYs", {0, 0, 0x0B, 0x13, 0, 0, 0x0B, 0x13, 1});
    add_chunk(png, "PLTE", {255, 0, 0, 0, 255, 0});
    add_chunk(png, "tEXt", to_bytes(std::string("k\0v", 3)));
    add_chunk(png, "IEND", {});

    std::vector<PngChunk> chunks;
    REQUIRE(parse_png(png, chunks) == PngStatus::Ok);
    REQUIRE(chunks.size() == 7);

    CHECK(std::get<GamaInfo>(chunks[1].details).gamma == 45455u);
    CHECK_FALSE(chunks[1].critical);
    CHECK_FALSE(chunks[1].safe_to_copy);
    CHECK(std::get<SrgbInfo>(chunks[2].details).rendering_intent == 0);
    CHECK(std::get<PhysInfo>(chunks[3].details).ppu_x == 2835u);
    CHECK(std::get<PhysInfo>(chunks[3].details).unit == 1);
    CHECK(std::get<PlteInfo>(chunks[4].details).entries.size() == 2);
    CHECK(std::get<PlteInfo>(chunks[4].details).entries[1].g == 255);

    CHECK(chunks[5].type == "tEXt");
    CHECK_FALSE(chunks[5].recognized);
    CHECK(chunks[5].safe_to_copy);
    CHECK_FALSE(chunks[5].details_valid);
}

TEST_CASE("iCCP keeps the compressed profile and flags unknown methods") {
    Bytes good = to_bytes("sRGB");
    good.insert(good.end(), {0x00, 0x00, 0x78, 0x9C, 0x01});
    Bytes odd = to_bytes("P");
    odd.insert(odd.end(), {0x00, 0x01, 0xAA});

    Bytes png = SIGNATURE;
    add_chunk(png, "IHDR", ihdr(1, 1));
    add_chunk(png, "iCCP", good);
    add_chunk(png, "iCCP", odd);
    add_chunk(png, "IEND", {});

    std::vector<PngChunk> chunks;
    REQUIRE(parse_png(png, chunks) == PngStatus::Ok);
    REQUIRE(chunks.size() == 4);

    CHECK(chunks[1].details_valid);
    const auto& icc = std::get<IccpInfo>(chunks[1].details);
    CHECK(icc.profile_name == "sRGB");
    CHECK(icc.compression_method == 0);
    CHECK(icc.compressed_profile == Bytes{0x78, 0x9C, 0x01});

    CHECK_FALSE(chunks[2].details_valid);
    CHECK(std::get<IccpInfo>(chunks[2].details).compression_method == 1);
}

TEST_CASE("malformed fixed-size chunks keep raw data only") {
    Bytes png = SIGNATURE;
    add_chunk(png, "IHDR", {1, 2, 3});
    add_chunk(png, "IEND", {});

    std::vector<PngChunk> chunks;
    REQUIRE(parse_png(png, chunks) == PngStatus::Ok);
    CHECK_FALSE(chunks[0].details_valid);
    CHECK(chunks[0].data == Bytes{1, 2, 3});
    CHECK(png_header(chunks) == nullptr);
}

TEST_CASE("a corrupted crc is reported but parsing continues") {
    Bytes png = minimal_png();
    png[8 + 8 + 13] ^= 0xFF;   // first byte of the IHDR crc

    std::vector<PngChunk> chunks;
    CHECK(parse_png(png, chunks) == PngStatus::CrcMismatch);
    REQUIRE(chunks.size() == 3);
    CHECK_FALSE(chunks[0].crc_matched);
    CHECK(chunks[1].crc_matched);
}

TEST_CASE("truncation and wrong signatures") {
    std::vector<PngChunk> chunks;
    CHECK(parse_png(to_bytes("GIF89a.."), chunks) == PngStatus::NotPng);

    Bytes cut = minimal_png();
    cut.resize(cut.size() - 5);
    CHECK(parse_png(cut, chunks) == PngStatus::Truncated);

    Bytes huge = SIGNATURE;
    append_u32_be(huge, 0xFFFFFFF0u);
    huge.insert(huge.end(), {'I', 'D', 'A', 'T', 0, 0, 0, 0});
    CHECK(parse_png(huge, chunks) == PngStatus::Truncated);
}

TEST_CASE("bytes after IEND are ignored") {
    Bytes png = minimal_png();
    png.insert(png.end(), {1, 2, 3});
    std::vector<PngChunk> chunks;
    CHECK(parse_png(png, chunks) == PngStatus::Ok);
    CHECK(chunks.size() == 3);
    CHECK(std::string(png_status_name(PngStatus::CrcMismatch)) == "crc_mismatch");
}
