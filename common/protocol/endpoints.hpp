#pragma once

#include "../types/session.hpp"
#include <string>
#include <string_view>

namespace tvremote::endpoints {

// ws[s]://<address>:<port>/api/v2/channels/samsung.remote.control?name=<b64>[&token=<t>]
std::string channel_url(const SessionConfig& config);

// Request target (path + query) part of channel_url()
std::string channel_target(const SessionConfig& config);

// Request targets for the REST api on packets::REST_PORT
std::string device_info_target();
std::string application_target(std::string_view app_id);

// SSDP M-SEARCH datagram for the remote control receiver; mx is the
// maximum response delay in seconds
std::string ssdp_search_request(int mx = 1);

} // namespace tvremote::endpoints
