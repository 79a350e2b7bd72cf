#include <doctest/doctest.h>
#include "zebralink/qr_code.hpp"

using namespace zebralink;

TEST_CASE("symbol side grows by four modules per version") {
    CHECK(qr_pixel_size(1) == 21);
    CHECK(qr_pixel_size(2) == 25);
    CHECK(qr_pixel_size(40) == 177);
    CHECK(qr_pixel_size(0) == 0);
    CHECK(qr_pixel_size(41) == 0);
}

TEST_CASE("capacity table lookups") {
    CHECK(qr_capacity(QrMode::Numeric, QrLevel::L, 1) == 41);
    CHECK(qr_capacity(QrMode::Numeric, QrLevel::Q, 1) == 27);
    CHECK(qr_capacity(QrMode::Alphanumeric, QrLevel::M, 1) == 20);
    CHECK(qr_capacity(QrMode::Byte, QrLevel::Q, 1) == 11);
    CHECK(qr_capacity(QrMode::Byte, QrLevel::H, 40) == 1273);
    CHECK(qr_capacity(QrMode::Byte, QrLevel::H, 0) == 0);
}

TEST_CASE("smallest version that holds the data") {
    CHECK(qr_version(QrMode::Byte, QrLevel::Q, 11) == 1);
    CHECK(qr_version(QrMode::Byte, QrLevel::Q, 12) == 2);
    CHECK(qr_version(QrMode::Numeric, QrLevel::L, 41) == 1);
    CHECK(qr_version(QrMode::Byte, QrLevel::H, 100000) == 40);
}

TEST_CASE("mode detection prefers the narrowest mode") {
    CHECK(qr_detect_mode("0123").mode == QrMode::Numeric);
    CHECK(qr_detect_mode("HELLO WORLD $5").mode == QrMode::Alphanumeric);
    CHECK(qr_detect_mode("hello").mode == QrMode::Byte);
    CHECK(qr_detect_mode("A,B").mode == QrMode::Byte);
    CHECK(qr_detect_mode("").mode == QrMode::Byte);
    CHECK(qr_detect_mode("hello").size == 5);

    CHECK(is_qr_alphanumeric(':'));
    CHECK_FALSE(is_qr_alphanumeric(','));
    CHECK_FALSE(is_qr_alphanumeric('a'));
}

TEST_CASE("magnification is clamped to 1..10") {
    CHECK(qr_magnification(100, 1) == 4);
    CHECK(qr_magnification(5, 1) == 1);
    CHECK(qr_magnification(10000, 1) == 10);
    CHECK(qr_magnification(100, 0) == 1);
}

TEST_CASE("field data prefixes") {
    CHECK(qr_field_prefix(QrLevel::Q, true, {QrMode::Byte, 3}) == "QA,");
    CHECK(qr_field_prefix(QrLevel::M, false, {QrMode::Numeric, 4}) == "MM,N");
    CHECK(qr_field_prefix(QrLevel::M, false, {QrMode::Alphanumeric, 4}) == "MM,A");
    CHECK(qr_field_prefix(QrLevel::H, false, {QrMode::Byte, 12}) == "HM,B0012");
}
