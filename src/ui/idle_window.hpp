#ifndef UI_IDLE_WINDOW_HPP
#define UI_IDLE_WINDOW_HPP

#include "features/display_commands.hpp"
#include "features/http_api.hpp"
#include "platform/weather_source.hpp"

#include <gtkmm.h>

#include <optional>
#include <string>

namespace ui {
class IdleWindow : public Gtk::Window
{
public:
    IdleWindow(DisplayCommands& commands, HttpApi& api, const WeatherSource& weather_source);
    ~IdleWindow() override;

protected:
    bool on_tick();
    void on_settings_changed_elsewhere();
    void on_temperature_unit_changed();
    void on_time_format_changed();
    void on_display_toggle(const char* key, Gtk::CheckButton& button);
    void on_button_reset();

    void refresh_context();
    void bind_settings(const SettingsDocument& settings);
    void send_patch(const std::string& patch_json, const std::string& what);
    void set_status_message(const std::string& text, bool is_error);

    DisplayCommands& m_commands;
    const WeatherSource& m_weather_source;
    std::optional<WeatherObservation> m_weather;

    Gtk::Box m_MainVBox;
    Gtk::Label m_TimeLabel;
    Gtk::Label m_DateLabel;
    Gtk::Label m_DayLabel;
    Gtk::Label m_ContextLabel;
    Gtk::Label m_QueryLabel;
    Gtk::Label m_WeatherLabel;
    Gtk::Label m_SunLabel;
    Gtk::Label m_CpuLabel;

    Gtk::Expander m_SettingsExpander;
    Gtk::Box m_SettingsBox;
    Gtk::DropDown m_TemperatureDropDown;
    Gtk::Switch m_TwelveHourSwitch;
    Gtk::CheckButton m_HumidityWindCheck;
    Gtk::CheckButton m_PrecipitationCheck;
    Gtk::CheckButton m_SunriseSunsetCheck;
    Gtk::CheckButton m_CpuTempCheck;
    Gtk::Button m_Button_Reset;
    Gtk::Label m_StatusLabel;

    Glib::Dispatcher m_settings_dispatcher;
    sigc::connection m_api_connection;
    sigc::connection m_tick_connection;
    bool m_binding_programmatically = false;
};
}  // namespace ui

#endif
