/* aberred

 This program is free software: you can redistribute it and/or modify
 it under the terms of the GNU General Public License as published by
 the Free Software Foundation, either version 3 of the License, or
 (at your option) any later version.

 This program is distributed in the hope that it will be useful,
 but WITHOUT ANY WARRANTY; without even the implied warranty of
 MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 GNU General Public License for more details.

 You should have received a copy of the GNU General Public License
 along with this program.  If not, see <https://www.gnu.org/licenses/>. */

#include "sokol/sokol_gfx.h"
#include "sokol/sokol_app.h"
#include "sokol/sokol_glue.h"
#include "sokol/sokol_log.h"
#include "sokol/sokol_time.h"
#include "sokol/util/sokol_debugtext.h"
#include "sokol_gp.h"
#include "argparse/argparse.hpp"
#include "game.hpp"
#include "renderer.hpp"
#include "texture.hpp"
#include "sokol_audio_device.hpp"
#include "settings.hpp"
#include "log.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>

static struct {
    GameConfig config;
    std::unique_ptr<Game> game;
    std::unique_ptr<Renderer> renderer;
    // Owned by the game as its asset loader
    TextureStore *textures = nullptr;
} state;

static void start_game(void) {
    if (!std::ifstream(state.config.main_script).good())
        throw std::runtime_error(fmt::format("Entry script '{}' not found", state.config.main_script));

    std::unique_ptr<AudioDevice> device;
    if (state.config.audio_enabled)
        device = std::make_unique<SokolAudioDevice>();

    auto textures = std::make_unique<TextureStore>();
    state.textures = textures.get();
    state.game = std::make_unique<Game>(std::move(textures), std::move(device), state.config);
    state.renderer = std::make_unique<Renderer>(state.config.render_width, state.config.render_height);

    if (!state.game->load_script(state.config.main_script))
        throw std::runtime_error(fmt::format("Failed to run entry script '{}'", state.config.main_script));
    state.game->start();
}

static void init(void) {
    sg_desc desc = {
        .environment = sglue_environment(),
        .buffer_pool_size = (1<<16)-1,
        .logger.func = slog_func,
    };
    sg_setup(&desc);
    sdtx_desc_t dtx_desc = {
        .fonts = { sdtx_font_oric() }
    };
    sdtx_setup(&dtx_desc);
    stm_setup();

    sgp_desc sgpdesc = { };
    sgp_setup(&sgpdesc);
    if (!sgp_is_valid()) {
        $Log.error("Failed to create Sokol GP context: {}", sgp_get_error_message(sgp_get_last_error()));
        exit(-1);
    }

    try {
        start_game();
    } catch (const std::runtime_error& e) {
        $Log.error("{}", e.what());
        state.game.reset();
        sapp_quit();
    }
}

static void frame(void) {
    if (!state.game) {
        sapp_quit();
        return;
    }
    if (!state.game->update((float)sapp_frame_duration())) {
        sapp_quit();
        return;
    }
    state.renderer->draw(state.game->world(), *state.textures, sapp_width(), sapp_height());
}

static void event(const sapp_event *event) {
    if (!state.game)
        return;
    InputState& input = state.game->input();
    switch (event->type) {
        case SAPP_EVENTTYPE_KEY_DOWN:
            if (event->key_code == SAPP_KEYCODE_F11 && !event->key_repeat)
                sapp_toggle_fullscreen();
            input.key_down(event->key_code);
            break;
        case SAPP_EVENTTYPE_KEY_UP:
            input.key_up(event->key_code);
            break;
        case SAPP_EVENTTYPE_MOUSE_MOVE:
            if (state.renderer)
                input.mouse_move(state.renderer->letterbox().window_to_target(glm::vec2(event->mouse_x, event->mouse_y)));
            break;
        case SAPP_EVENTTYPE_MOUSE_DOWN:
            input.mouse_button(event->mouse_button, true);
            break;
        case SAPP_EVENTTYPE_MOUSE_UP:
            input.mouse_button(event->mouse_button, false);
            break;
        case SAPP_EVENTTYPE_UNFOCUSED:
            input.release_all();
            state.game->pause();
            break;
        case SAPP_EVENTTYPE_FOCUSED:
            state.game->resume();
            break;
        case SAPP_EVENTTYPE_QUIT_REQUESTED:
            state.game->request_quit();
            break;
        default:
            break;
    }
}

static void cleanup(void) {
    state.game.reset();
    state.renderer.reset();
    sgp_shutdown();
    sdtx_shutdown();
    sg_shutdown();
}

sapp_desc sokol_main(int argc, char* argv[]) {
    Log::install_ecs_hooks();

    argparse::ArgumentParser program("aberred");

    program.add_argument("-c", "--config")
        .help("Path to the INI configuration file")
        .default_value(std::string("./config.ini"));

    program.add_argument("-s", "--script")
        .help("Path to the Lua entry script")
        .default_value(std::string(""));

    program.add_argument("--width")
        .help("Window width")
        .scan<'i', int>();

    program.add_argument("--height")
        .help("Window height")
        .scan<'i', int>();

    program.add_argument("--fullscreen")
        .help("Start fullscreen")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--no-audio")
        .help("Run without an audio device")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << program;
        exit(1);
    }

    $Settings.import_ini(program.get<std::string>("--config"));
    state.config = GameConfig::from_settings();
    std::string script = program.get<std::string>("--script");
    if (!script.empty())
        state.config.main_script = script;
    if (auto width = program.present<int>("--width"))
        state.config.window_width = *width;
    if (auto height = program.present<int>("--height"))
        state.config.window_height = *height;
    if (program.get<bool>("--fullscreen"))
        state.config.fullscreen = true;
    if (program.get<bool>("--no-audio"))
        state.config.audio_enabled = false;

    if (auto level = Log::parse_level(state.config.log_level))
        $Log.set_level(*level);
    else
        $Log.warn("[Config] Unknown log level '{}', using info", state.config.log_level);

    return (sapp_desc) {
        .init_cb = init,
        .frame_cb = frame,
        .cleanup_cb = cleanup,
        .event_cb = event,
        .width = state.config.window_width,
        .height = state.config.window_height,
        .swap_interval = state.config.vsync ? 1 : 0,
        .fullscreen = state.config.fullscreen,
        .window_title = state.config.window_title.c_str(),
        .logger.func = slog_func
    };
}
