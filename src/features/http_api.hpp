#ifndef FEATURES_HTTP_API_HPP
#define FEATURES_HTTP_API_HPP

#include "core/models.hpp"
#include "features/settings_store.hpp"

#include <sigc++/sigc++.h>

#include <mutex>
#include <optional>
#include <string>

namespace idleview {
constexpr int kHttpPort = 8737;
constexpr const char* kServiceName = "idleview-api";
}

struct ApiResponse {
    int status = 200;
    std::string body;
};

// Request handlers behind the HTTP transport. The transport owns sockets and
// threads and hands each request to handle_request().
class HttpApi {
public:
    explicit HttpApi(SettingsStore& store);

    ApiResponse handle_request(const std::string& method, const std::string& path, const std::string& body);

    ApiResponse get_settings() const;
    ApiResponse put_settings(const std::string& body);
    ApiResponse patch_settings(const std::string& body);
    ApiResponse reset_settings();
    ApiResponse health() const;
    ApiResponse get_current_photo() const;
    ApiResponse post_current_photo(const std::string& body);

    using SettingsUpdatedSlot = sigc::slot<void(const SettingsDocument&)>;

    // The slot runs on the request's thread, serialized with other
    // emissions, whenever a request changed the in-memory document. It must
    // not connect further slots. Disconnect only once the transport stopped.
    sigc::connection connect_settings_updated(const SettingsUpdatedSlot& slot);

private:
    ApiResponse settings_response(const SettingsResult& result, const char* action);

    SettingsStore& m_store;
    mutable std::mutex m_photo_mutex;
    std::optional<CurrentPhoto> m_current_photo;
    std::mutex m_signal_mutex;
    sigc::signal<void(const SettingsDocument&)> m_signal_settings_updated;
};

#endif
