#include <doctest/doctest.h>
#include "printer_profile.hpp"

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace zebralink;
namespace fs = std::filesystem;

TEST_CASE("profile json overlays only the fields present") {
    PrinterProfile p;
    std::string err;
    REQUIRE(profile_from_json(R"({"host":"10.0.0.9","dpi":300})", p, err));
    CHECK(p.host == "10.0.0.9");
    CHECK(p.dpi == doctest::Approx(300));
    CHECK(p.port == 21);
    CHECK(p.keepalive_ms == 60000);
}

TEST_CASE("profile json round trips") {
    PrinterProfile p;
    p.host = "printer.lan";
    p.port = 2121;
    p.user = "zebra";
    p.dpi = 600;
    p.connect_timeout_ms = 1500;
    p.keepalive_ms = 0;

    PrinterProfile q;
    std::string err;
    REQUIRE(profile_from_json(profile_to_json(p), q, err));
    CHECK(q.host == "printer.lan");
    CHECK(q.port == 2121);
    CHECK(q.user == "zebra");
    CHECK(q.dpi == doctest::Approx(600));
    CHECK(q.connect_timeout_ms == 1500);
    CHECK(q.keepalive_ms == 0);
}

TEST_CASE("bad profile json is rejected without touching the target") {
    PrinterProfile p;
    std::string err;

    CHECK_FALSE(profile_from_json("{not json", p, err));
    CHECK(err.rfind("parse_failed:", 0) == 0);

    CHECK_FALSE(profile_from_json("[1,2]", p, err));
    CHECK(err == "parse_failed:not an object");

    CHECK_FALSE(profile_from_json(R"({"host":"x","port":70000})", p, err));
    CHECK(err == "bad_field:port");
    CHECK(p.host == "127.0.0.1");

    CHECK_FALSE(profile_from_json(R"({"port":-1})", p, err));
    CHECK(err == "bad_field:port");
    CHECK_FALSE(profile_from_json(R"({"user":5})", p, err));
    CHECK(err == "bad_field:user");
    CHECK_FALSE(profile_from_json(R"({"dpi":0})", p, err));
    CHECK(err == "bad_field:dpi");
    CHECK_FALSE(profile_from_json(R"({"keepalive_ms":"soon"})", p, err));
    CHECK(err == "bad_field:keepalive_ms");
}

TEST_CASE("save then load through the config directory") {
    const fs::path dir = fs::temp_directory_path() /
                         ("zebralink-profile-" + std::to_string(getpid())) / "nested";
    const fs::path file = profile_path(dir);
    CHECK(file.filename() == "printer.json");

    PrinterProfile missing;
    std::string err;
    CHECK(load_profile(file, missing, err));
    CHECK(missing.host == "127.0.0.1");

    PrinterProfile p;
    p.host = "192.168.1.50";
    p.user = "admin";
    REQUIRE(save_profile(file, p, err));
    CHECK(fs::exists(file));
    CHECK_FALSE(fs::exists(fs::path(file.string() + ".tmp")));

    PrinterProfile back;
    REQUIRE(load_profile(file, back, err));
    CHECK(back.host == "192.168.1.50");
    CHECK(back.user == "admin");

    {
        std::ofstream out(file);
        out << "{\"port\": \"twenty-one\"}";
    }
    CHECK_FALSE(load_profile(file, back, err));
    CHECK(err == "bad_field:port");

    fs::remove_all(dir.parent_path());
}

TEST_CASE("default config dir follows XDG_CONFIG_HOME") {
    const char* old = std::getenv("XDG_CONFIG_HOME");
    const std::string saved = old ? old : "";

    setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
    CHECK(default_config_dir() == fs::path("/tmp/xdg-test/zebralink"));

    setenv("XDG_CONFIG_HOME", "", 1);
    CHECK(default_config_dir().filename() == "zebralink");
    CHECK(default_config_dir().parent_path().filename() == ".config");

    if (old) setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    else unsetenv("XDG_CONFIG_HOME");
}
