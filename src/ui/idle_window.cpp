#include "ui/idle_window.hpp"

#include "core/json_tree.hpp"

#include <iostream>
#include <json-glib/json-glib.h>

namespace {
const char* const kCpuSensorPath = "/sys/class/thermal/thermal_zone0/temp";

std::string single_member_patch(const char* section, const char* key, const std::string* text, bool flag) {
    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, section);
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, key);
    if (text) {
        json_builder_add_string_value(builder, text->c_str());
    } else {
        json_builder_add_boolean_value(builder, flag);
    }
    json_builder_end_object(builder);
    json_builder_end_object(builder);

    JsonNode* root = json_builder_get_root(builder);
    std::string patch = idleview::json_to_string(root, false);
    json_node_unref(root);
    g_object_unref(builder);
    return patch;
}

std::string string_patch(const char* section, const char* key, const std::string& value) {
    return single_member_patch(section, key, &value, false);
}

std::string bool_patch(const char* section, const char* key, bool value) {
    return single_member_patch(section, key, nullptr, value);
}

std::string time_part(const std::string& timestamp) {
    size_t pos = timestamp.find('T');
    return pos == std::string::npos ? timestamp : timestamp.substr(pos + 1);
}
}

namespace ui {
IdleWindow::IdleWindow(DisplayCommands& commands, HttpApi& api, const WeatherSource& weather_source)
: m_commands(commands),
  m_weather_source(weather_source),
  m_MainVBox(Gtk::Orientation::VERTICAL),
  m_SettingsExpander("Settings"),
  m_SettingsBox(Gtk::Orientation::VERTICAL),
  m_Button_Reset("Reset to defaults")
{
    set_title("idleview");
    set_default_size(800, 480);
    set_child(m_MainVBox);

    m_MainVBox.set_spacing(6);
    m_MainVBox.set_margin(24);

    m_TimeLabel.add_css_class("title-1");
    m_DayLabel.add_css_class("dim-label");
    m_QueryLabel.add_css_class("dim-label");
    for (Gtk::Label* label : {&m_TimeLabel, &m_DateLabel, &m_DayLabel, &m_ContextLabel, &m_QueryLabel,
                              &m_WeatherLabel, &m_SunLabel, &m_CpuLabel}) {
        label->set_halign(Gtk::Align::START);
        m_MainVBox.append(*label);
    }

    m_TemperatureDropDown.set_model(Gtk::StringList::create({"celsius", "fahrenheit"}));
    m_HumidityWindCheck.set_label("Show humidity and wind");
    m_PrecipitationCheck.set_label("Show precipitation and cloudiness");
    m_SunriseSunsetCheck.set_label("Show sunrise and sunset");
    m_CpuTempCheck.set_label("Show CPU temperature");

    auto* unitRow = Gtk::make_managed<Gtk::Box>(Gtk::Orientation::HORIZONTAL, 12);
    unitRow->append(*Gtk::make_managed<Gtk::Label>("Temperature unit"));
    unitRow->append(m_TemperatureDropDown);
    unitRow->append(*Gtk::make_managed<Gtk::Label>("12-hour clock"));
    unitRow->append(m_TwelveHourSwitch);

    m_SettingsBox.set_spacing(6);
    m_SettingsBox.append(*unitRow);
    m_SettingsBox.append(m_HumidityWindCheck);
    m_SettingsBox.append(m_PrecipitationCheck);
    m_SettingsBox.append(m_SunriseSunsetCheck);
    m_SettingsBox.append(m_CpuTempCheck);
    m_Button_Reset.set_halign(Gtk::Align::START);
    m_SettingsBox.append(m_Button_Reset);
    m_SettingsExpander.set_child(m_SettingsBox);
    m_SettingsExpander.set_margin_top(18);
    m_MainVBox.append(m_SettingsExpander);

    m_StatusLabel.set_halign(Gtk::Align::START);
    m_MainVBox.append(m_StatusLabel);

    m_TemperatureDropDown.property_selected().signal_changed().connect(
        sigc::mem_fun(*this, &IdleWindow::on_temperature_unit_changed));
    m_TwelveHourSwitch.property_active().signal_changed().connect(
        sigc::mem_fun(*this, &IdleWindow::on_time_format_changed));
    m_HumidityWindCheck.signal_toggled().connect([this]() {
        on_display_toggle("show_humidity_wind", m_HumidityWindCheck);
    });
    m_PrecipitationCheck.signal_toggled().connect([this]() {
        on_display_toggle("show_precipitation_cloudiness", m_PrecipitationCheck);
    });
    m_SunriseSunsetCheck.signal_toggled().connect([this]() {
        on_display_toggle("show_sunrise_sunset", m_SunriseSunsetCheck);
    });
    m_CpuTempCheck.signal_toggled().connect([this]() {
        on_display_toggle("show_cpu_temp", m_CpuTempCheck);
    });
    m_Button_Reset.signal_clicked().connect(sigc::mem_fun(*this, &IdleWindow::on_button_reset));

    // HTTP handlers run on the transport's threads, the dispatcher brings the
    // notification back to the main loop.
    m_settings_dispatcher.connect(sigc::mem_fun(*this, &IdleWindow::on_settings_changed_elsewhere));
    m_api_connection = api.connect_settings_updated([this](const SettingsDocument&) {
        m_settings_dispatcher.emit();
    });

    bind_settings(m_commands.get_settings().settings);
    refresh_context();
    m_tick_connection = Glib::signal_timeout().connect_seconds(sigc::mem_fun(*this, &IdleWindow::on_tick), 30);
}

IdleWindow::~IdleWindow() {
    m_api_connection.disconnect();
    m_tick_connection.disconnect();
}

bool IdleWindow::on_tick() {
    refresh_context();
    return true;
}

void IdleWindow::on_settings_changed_elsewhere() {
    bind_settings(m_commands.get_settings().settings);
    refresh_context();
    set_status_message("Settings updated remotely", false);
}

void IdleWindow::on_temperature_unit_changed() {
    if (m_binding_programmatically) {
        return;
    }
    const std::string unit = m_TemperatureDropDown.get_selected() == 1 ? "fahrenheit" : "celsius";
    send_patch(string_patch("units", "temperature_unit", unit), "temperature unit");
}

void IdleWindow::on_time_format_changed() {
    if (m_binding_programmatically) {
        return;
    }
    const std::string format = m_TwelveHourSwitch.get_active() ? "12h" : "24h";
    send_patch(string_patch("units", "time_format", format), "time format");
}

void IdleWindow::on_display_toggle(const char* key, Gtk::CheckButton& button) {
    if (m_binding_programmatically) {
        return;
    }
    send_patch(bool_patch("display", key, button.get_active()), key);
}

void IdleWindow::on_button_reset() {
    SettingsCommandResult result = m_commands.reset_settings();
    bind_settings(result.settings);
    refresh_context();
    if (result.success) {
        set_status_message("Settings reset to defaults", false);
    } else {
        set_status_message("Failed to reset settings: " + result.error, true);
    }
}

void IdleWindow::send_patch(const std::string& patch_json, const std::string& what) {
    SettingsCommandResult result = m_commands.update_settings(patch_json);
    if (result.success) {
        set_status_message("Updated " + what, false);
    } else {
        set_status_message("Failed to update " + what + ": " + result.error, true);
    }
    bind_settings(m_commands.get_settings().settings);
    refresh_context();
}

void IdleWindow::bind_settings(const SettingsDocument& settings) {
    m_binding_programmatically = true;
    m_TemperatureDropDown.set_selected(settings.units.temperature_unit == "fahrenheit" ? 1 : 0);
    m_TwelveHourSwitch.set_active(settings.units.time_format == "12h");
    m_HumidityWindCheck.set_active(settings.display.show_humidity_wind);
    m_PrecipitationCheck.set_active(settings.display.show_precipitation_cloudiness);
    m_SunriseSunsetCheck.set_active(settings.display.show_sunrise_sunset);
    m_CpuTempCheck.set_active(settings.display.show_cpu_temp);
    m_binding_programmatically = false;
}

void IdleWindow::refresh_context() {
    const SettingsDocument settings = m_commands.get_settings().settings;
    m_weather = m_weather_source.load(settings.units);

    const FormattedTime now = m_commands.get_current_time();
    m_TimeLabel.set_text(now.time);
    m_DateLabel.set_text(now.date);
    m_DayLabel.set_text(now.day_of_week);

    std::optional<std::string> sunrise;
    std::optional<std::string> sunset;
    if (m_weather) {
        sunrise = m_weather->sunrise;
        sunset = m_weather->sunset;
    }

    const TimeOfDay tod = m_commands.get_time_of_day(sunrise, sunset);
    std::string context = std::string(idleview::season_name(m_commands.get_season())) + " · " +
                          idleview::day_phase_name(tod.phase) + " (" + idleview::time_source_name(tod.source) +
                          ")";
    if (auto holiday = m_commands.get_holiday()) {
        context += " · " + *holiday;
    }
    m_ContextLabel.set_text(context);

    const WeatherObservation weather = m_weather.value_or(WeatherObservation());
    m_QueryLabel.set_text("Photo: " + m_commands.build_photo_query(weather, sunrise, sunset));

    std::string details;
    if (m_weather) {
        details = idleview::format_temperature(weather.temperature, settings.units);
        if (settings.display.show_humidity_wind) {
            details += "   Humidity " + std::to_string(static_cast<int>(weather.humidity)) + "%   Wind " +
                       std::to_string(static_cast<int>(weather.wind_speed)) + " " + weather.wind_speed_label;
        }
        if (settings.display.show_precipitation_cloudiness) {
            const PrecipitationDisplay precipitation = m_commands.get_precipitation_display(weather);
            details += "   " + precipitation.label + " " + precipitation.value + "   Clouds " +
                       std::to_string(static_cast<int>(weather.cloudcover)) + "%";
        }
    }
    m_WeatherLabel.set_text(details);
    m_WeatherLabel.set_visible(!details.empty());

    const bool show_sun = m_weather && settings.display.show_sunrise_sunset;
    m_SunLabel.set_text(show_sun ? "Sunrise " + time_part(weather.sunrise) + "   Sunset " + time_part(weather.sunset)
                                 : "");
    m_SunLabel.set_visible(show_sun);

    const std::string cpu = settings.display.show_cpu_temp ? m_commands.get_cpu_temp(kCpuSensorPath) : "";
    m_CpuLabel.set_text(cpu.empty() ? "" : "CPU " + cpu);
    m_CpuLabel.set_visible(!cpu.empty());
}

void IdleWindow::set_status_message(const std::string& text, bool is_error) {
    m_StatusLabel.set_text(text);
    if (is_error) {
        m_StatusLabel.add_css_class("error");
        std::cerr << "[host] " << text << '\n';
    } else {
        m_StatusLabel.remove_css_class("error");
    }
}
}  // namespace ui
