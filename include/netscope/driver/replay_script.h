#pragma once
#include <netscope/devtools/network_event.h>
#include <netscope/driver/scripted_browser.h>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace netscope::driver {

enum class StepKind {
    Request,
    Response,
    Fail,
};

struct ReplayStep {
    StepKind kind = StepKind::Request;
    devtools::NetworkEvent event;
    std::string message;       // Fail only
    std::size_t line = 0;
};

struct ReplayScript {
    std::vector<ReplayStep> steps;

    std::size_t event_count() const;
};

struct ParseResult {
    bool ok = false;
    std::string message;
    ReplayScript script;
};

// Line grammar:
//   request  <METHOD> <URL>
//   response <STATUS> <URL> [<CONTENT-TYPE>]
//   fail     <message...>
// Blank lines and lines starting with '#' are skipped.
ParseResult parse_replay_script(std::istream& in);
ParseResult load_replay_script(const std::string& path);

// Test body for a replay: posts each event to the session through the
// browser's dispatch thread and waits for delivery. A Fail step throws
// std::runtime_error carrying its message once earlier events are delivered.
void play_replay(const ReplayScript& script, ScriptedBrowser& browser,
                 const std::string& session_id);

} // namespace netscope::driver
