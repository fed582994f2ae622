#include "config_io.hpp"
#include "core/sun_time_cache.hpp"
#include "features/display_commands.hpp"
#include "features/http_api.hpp"
#include "features/settings_store.hpp"
#include "platform/weather_source.hpp"
#include "ui/idle_window.hpp"

#include <gtkmm.h>

#include <cstdlib>
#include <iostream>

int main(int argc, char* argv[])
{
    SettingsStore store(ConfigIO::defaultSettingsPath());
    SettingsResult loaded = store.initialize();
    if (!loaded.success) {
        std::cerr << "[host] Continuing with default settings: " << loaded.error << '\n';
    }
    std::cerr << "[host] Settings file: " << store.file_path() << '\n';

    SunTimeCache sunCache;
    DisplayCommands commands(store, sunCache);
    HttpApi api(store);
    std::cerr << "[host] API handlers ready for the transport on port " << idleview::kHttpPort << '\n';

    const char* weatherPath = std::getenv("IDLEVIEW_WEATHER_FILE");
    WeatherSource weather(weatherPath ? weatherPath : "");

    auto app = Gtk::Application::create("io.idleview.Display");
    return app->make_window_and_run<ui::IdleWindow>(argc, argv, commands, api, weather);
}
