#include <netscope/driver/replay_script.h>

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <variant>
#include <vector>

using namespace netscope::driver;
using netscope::devtools::RequestEvent;
using netscope::devtools::ResponseEvent;

TEST(ReplayScriptTest, ParsesRequestsResponsesAndComments) {
    std::istringstream in(
        "# google search\n"
        "request GET https://www.google.com/\n"
        "\n"
        "response 200 https://www.google.com/ text/html\n"
        "  response 204 https://www.google.com/gen_204\n");

    auto result = parse_replay_script(in);
    ASSERT_TRUE(result.ok) << result.message;
    ASSERT_EQ(result.script.steps.size(), 3u);
    EXPECT_EQ(result.script.event_count(), 3u);

    const auto& first = result.script.steps[0];
    EXPECT_EQ(first.kind, StepKind::Request);
    EXPECT_EQ(first.line, 2u);
    EXPECT_EQ(std::get<RequestEvent>(first.event).url, "https://www.google.com/");

    const auto& second = std::get<ResponseEvent>(result.script.steps[1].event);
    EXPECT_EQ(second.status, 200);
    EXPECT_EQ(second.content_type, "text/html");

    const auto& third = std::get<ResponseEvent>(result.script.steps[2].event);
    EXPECT_EQ(third.status, 204);
    EXPECT_TRUE(third.content_type.empty());
}

TEST(ReplayScriptTest, ParsesFailStep) {
    std::istringstream in("request GET https://x/\nfail element q not found\n");

    auto result = parse_replay_script(in);
    ASSERT_TRUE(result.ok);
    ASSERT_EQ(result.script.steps.size(), 2u);
    EXPECT_EQ(result.script.steps[1].kind, StepKind::Fail);
    EXPECT_EQ(result.script.steps[1].message, "element q not found");
    EXPECT_EQ(result.script.event_count(), 1u);
}

TEST(ReplayScriptTest, RejectsMalformedLines) {
    {
        std::istringstream in("request GET\n");
        auto result = parse_replay_script(in);
        EXPECT_FALSE(result.ok);
        EXPECT_NE(result.message.find("line 1"), std::string::npos);
    }
    {
        std::istringstream in("request GET https://x/\nresponse abc https://x/\n");
        auto result = parse_replay_script(in);
        EXPECT_FALSE(result.ok);
        EXPECT_NE(result.message.find("line 2"), std::string::npos);
    }
    {
        std::istringstream in("navigate https://x/\n");
        auto result = parse_replay_script(in);
        EXPECT_FALSE(result.ok);
        EXPECT_NE(result.message.find("navigate"), std::string::npos);
    }
}

TEST(ReplayScriptTest, LoadMissingFileFails) {
    auto result = load_replay_script("/nonexistent/netscope/script.txt");
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.message.empty());
}

TEST(ReplayScriptTest, PlayDeliversEventsThenThrowsOnFail) {
    std::istringstream in(
        "request GET https://x/\n"
        "response 500 https://x/ text/html\n"
        "fail server error\n"
        "request GET https://never/\n");
    auto parsed = parse_replay_script(in);
    ASSERT_TRUE(parsed.ok);

    ScriptedBrowser browser;
    auto session = browser.create_session();
    auto channel = browser.open_debug_channel(*session);
    browser.enable(*channel);
    std::vector<std::string> urls;
    browser.on_request(*channel, [&urls](const RequestEvent& e) { urls.push_back(e.url); });
    browser.on_response(*channel, [&urls](const ResponseEvent& e) { urls.push_back(e.url); });

    EXPECT_THROW(play_replay(parsed.script, browser, session->id()), std::runtime_error);

    ASSERT_EQ(urls.size(), 2u);
    EXPECT_EQ(urls[0], "https://x/");
    EXPECT_EQ(urls[1], "https://x/");
}
