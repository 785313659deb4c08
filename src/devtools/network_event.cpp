#include <netscope/devtools/network_event.h>

#include <sstream>

namespace netscope::devtools {

namespace {

template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

bool operator==(const RequestEvent& a, const RequestEvent& b) {
    return a.method == b.method && a.url == b.url;
}

bool operator==(const ResponseEvent& a, const ResponseEvent& b) {
    return a.status == b.status && a.url == b.url && a.content_type == b.content_type;
}

std::string format_network_event(const NetworkEvent& event) {
    std::ostringstream oss;
    std::visit(overloaded{
        [&oss](const RequestEvent& req) {
            oss << "Request: [Method: " << req.method << ", URL: " << req.url << "]";
        },
        [&oss](const ResponseEvent& resp) {
            oss << "Response: [Status: " << resp.status << ", URL: " << resp.url
                << ", Content-Type: " << resp.content_type << "]";
        },
    }, event);
    return oss.str();
}

} // namespace netscope::devtools
