/**
 * @file TestSettings.cpp
 * @brief INI import and export, typed reads and the game configuration
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "helpers.hpp"

using Catch::Matchers::WithinAbs;

TEST_CASE("INI text becomes typed settings", "[settings]") {
    $Settings.clear();

    SECTION("sections prefix their keys and values are typed") {
        REQUIRE($Settings.import_ini_string(R"(
            ; comment
            # another comment
            [render]
            width = 320
            height = 180

            [window]
            title = "My Game"
            vsync = false
            scale = 1.5
        )"));
        REQUIRE($Settings.get<int>("render.width") == 320);
        REQUIRE($Settings.get<std::string>("window.title") == "My Game");
        REQUIRE_FALSE($Settings.get<bool>("window.vsync"));
        REQUIRE_THAT($Settings.get<float>("window.scale"), WithinAbs(1.5f, 1e-6));
        REQUIRE($Settings.type_of("render.height") == typeid(int));
    }

    SECTION("malformed lines are skipped and reported") {
        REQUIRE_FALSE($Settings.import_ini_string("[broken\nvalid = 1\nnot a pair\n = 3\n"));
        REQUIRE($Settings.get<int>("valid") == 1);
        REQUIRE($Settings.keys().size() == 1);
    }

    SECTION("typed reads fall back or convert") {
        $Settings.set("count", 3);
        $Settings.set("ratio", .5f);
        $Settings.set("name", "x");
        REQUIRE_THAT($Settings.get_or<float>("count", 0.f), WithinAbs(3.f, 1e-6));
        REQUIRE($Settings.get_or<int>("ratio", 9) == 0);
        REQUIRE($Settings.get_or<int>("name", 9) == 9);
        REQUIRE($Settings.get_or<std::string>("count", "") == "3");
        REQUIRE($Settings.get_or<int>("missing", 42) == 42);
        REQUIRE_THROWS($Settings.get<int>("missing"));
        REQUIRE_THROWS($Settings.get<int>("name"));
    }

    SECTION("export groups keys back into sections") {
        $Settings.set("top", 1);
        $Settings.set("audio.enabled", true);
        $Settings.set("audio.volume", 7);
        std::string text = $Settings.export_ini_string();
        REQUIRE(text == "top = 1\n\n[audio]\nenabled = true\nvolume = 7\n\n");

        $Settings.clear();
        REQUIRE($Settings.import_ini_string(text));
        REQUIRE($Settings.get<bool>("audio.enabled"));
        REQUIRE($Settings.get<int>("top") == 1);
    }

    SECTION("files round through disk") {
        TempDir dir("settings");
        std::string path = dir.write("config.ini", "[log]\nlevel = debug\n");
        REQUIRE($Settings.import_ini(path));
        REQUIRE($Settings.get<std::string>("log.level") == "debug");
        REQUIRE_FALSE($Settings.import_ini((dir.path() / "absent.ini").string()));
    }

    $Settings.clear();
}

TEST_CASE("Game configuration reads settings with defaults", "[settings][config]") {
    $Settings.clear();

    SECTION("an empty store gives the defaults") {
        GameConfig config = GameConfig::from_settings();
        REQUIRE(config.render_width == 640);
        REQUIRE(config.render_height == 360);
        REQUIRE(config.window_title == "Aberred Engine");
        REQUIRE(config.audio_enabled);
        REQUIRE(config.log_level == "info");
    }

    SECTION("values override and an invalid render size resets") {
        REQUIRE($Settings.import_ini_string(
            "[render]\nwidth = 0\nheight = 200\n[window]\nfullscreen = true\n[audio]\nenabled = false\n"));
        GameConfig config = GameConfig::from_settings();
        REQUIRE(config.render_width == 640);
        REQUIRE(config.render_height == 360);
        REQUIRE(config.fullscreen);
        REQUIRE_FALSE(config.audio_enabled);
    }

    SECTION("storing and reading back is stable") {
        GameConfig config;
        config.window_width = 800;
        config.main_script = "game.lua";
        config.store_settings();
        GameConfig loaded = GameConfig::from_settings();
        REQUIRE(loaded.window_width == 800);
        REQUIRE(loaded.main_script == "game.lua");
    }

    $Settings.clear();
}

TEST_CASE("Log levels parse by name", "[settings][log]") {
    REQUIRE(Log::parse_level("debug") == std::optional<LogLevel>(LogLevel::Debug));
    REQUIRE(Log::parse_level("warn") == std::optional<LogLevel>(LogLevel::Warning));
    REQUIRE_FALSE(Log::parse_level("chatty"));
}
