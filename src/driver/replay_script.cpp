#include <netscope/driver/replay_script.h>

#include <charconv>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace netscope::driver {

namespace {

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool parse_status(const std::string& text, int& status) {
    int parsed = 0;
    const char* begin = text.data();
    const char* end = begin + text.size();
    const std::from_chars_result result = std::from_chars(begin, end, parsed);
    if (result.ec != std::errc() || result.ptr != end || parsed < 100 || parsed > 999) {
        return false;
    }
    status = parsed;
    return true;
}

ParseResult failure(std::size_t line, const std::string& message) {
    ParseResult result;
    result.ok = false;
    result.message = "line " + std::to_string(line) + ": " + message;
    return result;
}

} // namespace

std::size_t ReplayScript::event_count() const {
    std::size_t count = 0;
    for (const auto& step : steps) {
        if (step.kind != StepKind::Fail) {
            ++count;
        }
    }
    return count;
}

ParseResult parse_replay_script(std::istream& in) {
    ParseResult result;
    std::string raw;
    std::size_t line_no = 0;

    while (std::getline(in, raw)) {
        ++line_no;
        const std::string line = trim(raw);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::istringstream fields(line);
        std::string keyword;
        fields >> keyword;

        ReplayStep step;
        step.line = line_no;

        if (keyword == "request") {
            devtools::RequestEvent request;
            if (!(fields >> request.method >> request.url)) {
                return failure(line_no, "request needs <METHOD> <URL>");
            }
            step.kind = StepKind::Request;
            step.event = std::move(request);
        } else if (keyword == "response") {
            std::string status_text;
            devtools::ResponseEvent response;
            if (!(fields >> status_text >> response.url)) {
                return failure(line_no, "response needs <STATUS> <URL>");
            }
            if (!parse_status(status_text, response.status)) {
                return failure(line_no, "invalid status '" + status_text + "'");
            }
            fields >> response.content_type;
            step.kind = StepKind::Response;
            step.event = std::move(response);
        } else if (keyword == "fail") {
            std::string rest;
            std::getline(fields, rest);
            step.kind = StepKind::Fail;
            step.message = trim(rest);
            if (step.message.empty()) {
                step.message = "replay step failed";
            }
        } else {
            return failure(line_no, "unknown step '" + keyword + "'");
        }

        result.script.steps.push_back(std::move(step));
    }

    result.ok = true;
    return result;
}

ParseResult load_replay_script(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        ParseResult result;
        result.message = "cannot open replay script " + path;
        return result;
    }
    return parse_replay_script(file);
}

void play_replay(const ReplayScript& script, ScriptedBrowser& browser,
                 const std::string& session_id) {
    for (const auto& step : script.steps) {
        if (step.kind == StepKind::Fail) {
            browser.wait_idle();
            throw std::runtime_error(step.message);
        }
        browser.post(session_id, step.event);
    }
    browser.wait_idle();
}

} // namespace netscope::driver
