#include <doctest/doctest.h>
#include "zebralink/ipv4.hpp"
#include "zebralink/payload.hpp"

#include <unistd.h>

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace zebralink;

TEST_CASE("dotted quads parse into host order") {
    uint32_t a = 0;
    CHECK(parse_ipv4("192.168.1.50", a));
    CHECK(a == 0xC0A80132u);
    CHECK(format_ipv4(a) == "192.168.1.50");
    CHECK(parse_ipv4("0.0.0.0", a));
    CHECK(a == 0u);

    CHECK_FALSE(parse_ipv4("256.1.1.1", a));
    CHECK_FALSE(parse_ipv4("1.2.3", a));
    CHECK_FALSE(parse_ipv4("1.2.3.4.5", a));
    CHECK_FALSE(parse_ipv4("1..3.4", a));
    CHECK_FALSE(parse_ipv4("a.b.c.d", a));
    CHECK_FALSE(parse_ipv4("", a));
}

TEST_CASE("shared subnet lookup skips unusable interfaces") {
    const std::vector<Ipv4Interface> ifaces = {
        {"any", 0x0A000001, 0x00000000},
        {"down", 0x00000000, 0xFFFFFF00},
        {"eth0", 0xC0A8010A, 0xFFFFFF00},
        {"eth1", 0xC0A80114, 0xFFFF0000},
    };
    Ipv4Interface out;
    REQUIRE(find_shared_subnet(ifaces, 0xC0A80132, out));
    CHECK(out.name == "eth0");
    REQUIRE(find_shared_subnet(ifaces, 0xC0A80901, out));
    CHECK(out.name == "eth1");
    CHECK_FALSE(find_shared_subnet(ifaces, 0x0A000002, out));
    CHECK(same_subnet(0x0A000001, 0x0AFFFFFF, 0xFF000000));
}

TEST_CASE("PORT arguments carry address and port bytes") {
    CHECK(format_port_argument(0xC0A8010A, 5000) == "192,168,1,10,19,136");
    CHECK(format_port_argument(0x7F000001, 21) == "127,0,0,1,0,21");

    uint32_t addr = 0;
    uint16_t port = 0;
    REQUIRE(parse_port_argument("10,0,0,7,195,80", addr, port));
    CHECK(addr == 0x0A000007u);
    CHECK(port == 50000);
    CHECK_FALSE(parse_port_argument("10,0,0,7,195", addr, port));
    CHECK_FALSE(parse_port_argument("10,0,0,7,300,1", addr, port));
}

TEST_CASE("buffer sources hand out their bytes in chunks") {
    BufferSource src(std::string("abcdef"));
    CHECK(src.size() == 6);
    uint8_t buf[4];
    CHECK(src.read(buf, sizeof(buf)) == 4);
    CHECK(buf[0] == 'a');
    CHECK(src.read(buf, sizeof(buf)) == 2);
    CHECK(buf[1] == 'f');
    CHECK(src.read(buf, sizeof(buf)) == 0);
    CHECK_FALSE(src.failed());
}

TEST_CASE("file sources stream a file from disk") {
    const std::filesystem::path p = std::filesystem::temp_directory_path() /
                                    ("zebralink-payload-" + std::to_string(getpid()) + ".zpl");
    {
        std::ofstream out(p, std::ios::binary);
        out << "^XA^FDhi^FS^XZ";
    }

    std::string err;
    auto src = FileSource::open(p.string(), err);
    REQUIRE(src != nullptr);
    CHECK(src->size() == 14);

    std::string got;
    uint8_t buf[5];
    for (std::size_t n; (n = src->read(buf, sizeof(buf))) > 0;) got.append(reinterpret_cast<char*>(buf), n);
    CHECK(got == "^XA^FDhi^FS^XZ");
    CHECK_FALSE(src->failed());

    std::remove(p.string().c_str());

    CHECK(FileSource::open(p.string(), err) == nullptr);
    CHECK(err == "not_found:" + p.string());
}
