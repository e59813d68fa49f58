#include <doctest/doctest.h>
#include "channels/cli_channel.hpp"
#include "channels/http_channel.hpp"
#include "test_helpers.hpp"
#include <sstream>
#include <thread>

using namespace chime;
using namespace chime::testing;

TEST_CASE("CLI channel handles one utterance per line until an exit word") {
    std::istringstream in("remind me at 4pm to stretch\n\nlist reminders\nquit\nlist reminders\n");
    std::ostringstream out;
    CLIChannel cli(in, out);

    std::vector<std::string> seen;
    cli.start([&](const Utterance& msg) {
        seen.push_back(msg.text);
        CHECK(msg.channel == "cli");
        return "ok";
    });

    CHECK(cli.run("> ") == 2);
    CHECK(seen == std::vector<std::string>{"remind me at 4pm to stretch", "list reminders"});
    CHECK(out.str().find("Goodbye! Have a great day!") != std::string::npos);
}

TEST_CASE("CLI channel stops at end of input") {
    std::istringstream in("help\n");
    std::ostringstream out;
    CLIChannel cli(in, out);
    cli.start([](const Utterance&) { return "reply"; });
    CHECK(cli.run() == 1);
    CHECK(out.str().find("reply") != std::string::npos);
    CHECK(CLIChannel::is_exit_word("exit"));
    CHECK_FALSE(CLIChannel::is_exit_word("remind me to exit"));
}

TEST_CASE("CLI channel stops between utterances once stop() is called") {
    std::istringstream in("first\nsecond\nthird\n");
    std::ostringstream out;
    CLIChannel cli(in, out);
    std::vector<std::string> seen;
    cli.start([&](const Utterance& msg) {
        seen.push_back(msg.text);
        cli.stop();
        return "ok";
    });
    CHECK(cli.run() == 1);
    CHECK(seen == std::vector<std::string>{"first"});

    std::istringstream in2("help\n");
    CLIChannel stopped(in2, out);
    stopped.start([](const Utterance&) { return "reply"; });
    stopped.stop();
    CHECK(stopped.run() == 0);
}

TEST_CASE("CLI channel exits when its input is interrupted") {
    std::istringstream in("help\n");
    in.setstate(std::ios::failbit);
    std::ostringstream out;
    CLIChannel cli(in, out);
    int calls = 0;
    cli.start([&](const Utterance&) { ++calls; return "reply"; });
    CHECK(cli.run() == 0);
    CHECK(calls == 0);
}

namespace {

struct HttpFixture {
    TempDb tmp;
    ReminderStore store{tmp.path};
    ReminderService service{store, 0, [] { return at(0, 15); }};
    int port = 18900 + static_cast<int>(std::hash<std::string>{}(tmp.path) % 1000);

    std::unique_ptr<httplib::Client> client() {
        auto c = std::make_unique<httplib::Client>("127.0.0.1", port);
        c->set_connection_timeout(2);
        c->set_read_timeout(5);
        return c;
    }

    // Polls /health until the listener thread is accepting.
    bool wait_ready() {
        for (int i = 0; i < 200; ++i) {
            if (auto res = client()->Get("/health")) return res->status == 200;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    }
};

} // namespace

TEST_CASE_FIXTURE(HttpFixture, "HTTP API creates, lists and cancels reminders") {
    HTTPChannelConfig cfg;
    HTTPChannel http("127.0.0.1", port, cfg, service);
    http.start([this](const Utterance& msg) { return service.handle_command(msg.text); });
    REQUIRE(wait_ready());
    auto cli = client();

    auto created = cli->Post("/reminders", R"({"message":"water the plants","when":"4pm"})",
                             "application/json");
    REQUIRE(created);
    CHECK(created->status == 201);
    auto body = nlohmann::json::parse(created->body);
    CHECK(body["message"] == "water the plants");
    CHECK(body["fire_at"] == at(0, 16));
    int64_t id = body["id"].get<int64_t>();

    auto bad_time = cli->Post("/reminders", R"({"message":"dance","when":"25:00"})",
                              "application/json");
    REQUIRE(bad_time);
    CHECK(bad_time->status == 400);
    CHECK(nlohmann::json::parse(bad_time->body)["text"] == "25:00");

    auto no_message = cli->Post("/reminders", R"({"when":"4pm"})", "application/json");
    REQUIRE(no_message);
    CHECK(no_message->status == 400);

    auto not_json = cli->Post("/reminders", "{", "application/json");
    REQUIRE(not_json);
    CHECK(not_json->status == 400);

    auto one = cli->Get(("/reminders/" + std::to_string(id)).c_str());
    REQUIRE(one);
    CHECK(one->status == 200);

    auto missing = cli->Get("/reminders/999");
    REQUIRE(missing);
    CHECK(missing->status == 404);

    auto listed = cli->Get("/reminders");
    REQUIRE(listed);
    CHECK(nlohmann::json::parse(listed->body)["reminders"].size() == 1);

    auto cancelled = cli->Delete(("/reminders/" + std::to_string(id)).c_str());
    REQUIRE(cancelled);
    CHECK(cancelled->status == 200);
    CHECK(store.get(id).status == ReminderStatus::cancelled);

    auto pending = cli->Get("/reminders");
    REQUIRE(pending);
    CHECK(nlohmann::json::parse(pending->body)["reminders"].empty());
    auto all = cli->Get("/reminders?status=all");
    REQUIRE(all);
    CHECK(nlohmann::json::parse(all->body)["reminders"].size() == 1);

    auto bad_status = cli->Get("/reminders?status=done");
    REQUIRE(bad_status);
    CHECK(bad_status->status == 400);

    auto chat = cli->Post("/chat", R"({"text":"remind me in 20 minutes to stretch"})",
                          "application/json");
    REQUIRE(chat);
    CHECK(chat->status == 200);
    CHECK(nlohmann::json::parse(chat->body)["reply"] ==
          "I'll remind you to stretch at 2024-01-01 03:20 PM. (#2)");

    http.stop();
}

TEST_CASE_FIXTURE(HttpFixture, "HTTP API enforces the bearer token") {
    HTTPChannelConfig cfg;
    cfg.api_key = "s3cret";
    HTTPChannel http("127.0.0.1", port, cfg, service);
    http.start([](const Utterance&) { return "ok"; });
    REQUIRE(wait_ready());
    auto cli = client();

    auto denied = cli->Get("/reminders");
    REQUIRE(denied);
    CHECK(denied->status == 401);

    httplib::Headers headers = {{"Authorization", "Bearer s3cret"}};
    auto allowed = cli->Get("/reminders", headers);
    REQUIRE(allowed);
    CHECK(allowed->status == 200);

    http.stop();
}

TEST_CASE_FIXTURE(HttpFixture, "HTTP API treats out-of-range ids as missing") {
    HTTPChannelConfig cfg;
    HTTPChannel http("127.0.0.1", port, cfg, service);
    http.start([](const Utterance&) { return "ok"; });
    REQUIRE(wait_ready());
    auto cli = client();

    auto got = cli->Get("/reminders/99999999999999999999999");
    REQUIRE(got);
    CHECK(got->status == 404);
    CHECK(nlohmann::json::parse(got->body)["error"] == "reminder not found");

    auto deleted = cli->Delete("/reminders/99999999999999999999999");
    REQUIRE(deleted);
    CHECK(deleted->status == 404);

    http.stop();
}

TEST_CASE_FIXTURE(HttpFixture, "HTTP API bounds request and utterance size") {
    HTTPChannelConfig cfg;
    HTTPChannel http("127.0.0.1", port, cfg, service);
    http.start([this](const Utterance& msg) { return service.handle_command(msg.text); });
    REQUIRE(wait_ready());
    auto cli = client();

    nlohmann::json big;
    big["text"] = "remind me " + std::string(200000, 'a');
    auto rejected = cli->Post("/chat", big.dump(), "application/json");
    // The server may close the connection before the client finishes sending.
    if (rejected) CHECK(rejected->status == 413);

    nlohmann::json wordy;
    wordy["text"] = "remind me " + std::string(5000, 'a');
    auto refused = cli->Post("/chat", wordy.dump(), "application/json");
    REQUIRE(refused);
    CHECK(refused->status == 200);
    std::string reply = nlohmann::json::parse(refused->body)["reply"];
    CHECK(reply.rfind("That's too long", 0) == 0);
    CHECK(store.list({}).empty());

    http.stop();
}
