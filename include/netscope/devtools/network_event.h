#pragma once
#include <cstdint>
#include <string>
#include <variant>

namespace netscope::devtools {

// Outgoing request notification (Network.requestWillBeSent).
struct RequestEvent {
    std::string method;
    std::string url;
};

// Response notification (Network.responseReceived).
struct ResponseEvent {
    int status = 0;
    std::string url;
    std::string content_type;
};

using NetworkEvent = std::variant<RequestEvent, ResponseEvent>;

bool operator==(const RequestEvent& a, const RequestEvent& b);
bool operator==(const ResponseEvent& a, const ResponseEvent& b);

// "Request: [Method: GET, URL: https://x/]"
// "Response: [Status: 200, URL: https://x/, Content-Type: text/html]"
std::string format_network_event(const NetworkEvent& event);

} // namespace netscope::devtools
