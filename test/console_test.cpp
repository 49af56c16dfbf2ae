#include <algorithm>
#include <catch2/catch.hpp>
#include <memory>
#include <nlohmann/json.hpp>
#include <sstream>
#include <thread>

#include "client/client.hpp"
#include "config_manager.hpp"
#include "console.hpp"
#include "mock_transport.hpp"


using namespace std::literals::chrono_literals;

static nlohmann::json mediaJson(std::size_t i) {
    return {{"key", "m" + std::to_string(i)}, {"artist", "The Beatles"}, {"title", "Song " + std::to_string(i)},
            {"length", 180}, {"uploadedByKey", "u1"}};
}

// Answers `follow` with the state of both topics, and searches from a catalogue of `available` songs
static std::string marietje(std::string const & body, std::size_t available) {
    nlohmann::json messages = nlohmann::json::array();
    for (nlohmann::json const & message : nlohmann::json::parse(body)) {
        if (!message.is_object()) continue;

        if (message["type"] == "follow") {
            messages.push_back({{"type", "playing"}, {"playing", {
                {"byKey", "alice"}, {"endTime", 1300.0}, {"media", mediaJson(1)}, {"serverTime", 1000.0}
            }}});
            messages.push_back({{"type", "requests"}, {"requests", {
                {{"byKey", "bob"}, {"key", 7}, {"media", mediaJson(2)}},
                {{"byKey", nullptr}, {"key", 8}, {"media", mediaJson(3)}}
            }}});
        } else if (message["type"] == "query_media") {
            std::size_t const skip = message["skip"];
            std::size_t const count = message["count"];
            nlohmann::json results = nlohmann::json::array();
            for (std::size_t i = skip; i < std::min(available, skip + count); i++) {
                results.push_back(mediaJson(i));
            }
            messages.push_back({{"type", "query_media_results"}, {"token", message["token"]}, {"results", results}});
        }
    }

    if (messages.empty()) std::this_thread::sleep_for(5ms); // Long poll
    return nlohmann::json{"s1", messages}.dump();
}

static std::unique_ptr<MockTransport> marietjeTransport(std::size_t available = 0) {
    auto transport = std::make_unique<MockTransport>();
    transport->setResponder([available](std::string const & body) { return marietje(body, available); });
    return transport;
}

static std::size_t countLines(std::string const & text) {
    return std::count(text.begin(), text.end(), '\n');
}


TEST_CASE("Durations are printed like a music player would", "[console]") {
    CHECK(formatDuration(0s) == "0:00");
    CHECK(formatDuration(59s) == "0:59");
    CHECK(formatDuration(185s) == "3:05");
    CHECK(formatDuration(185900ms) == "3:05");
    CHECK(formatDuration(3725s) == "1:02:05");
}

TEST_CASE("Login errors are explained", "[console]") {
    CHECK(loginErrorText("User does not exist", "alice") == "Login failed: user \"alice\" does not exist");
    CHECK(loginErrorText("Wrong password", "alice") == "Login failed: wrong password");
    CHECK(loginErrorText("Server on fire", "alice") == "Login failed: Server on fire");
}

TEST_CASE("Mistyped commands get a suggestion", "[console]") {
    CHECK(editDistance("queue", "queue") == 0);
    CHECK(editDistance("qeue", "queue") == 1);
    CHECK(editDistance("", "watch") == 5);
    CHECK(editDistance("kitten", "sitting") == 3);

    CHECK(noSuchCommandText("qeue") == "No such command: 'qeue'. Did you mean 'queue'?");
    CHECK(noSuchCommandText("serach") == "No such command: 'serach'. Did you mean 'search'?");
    CHECK(noSuchCommandText("plaing") == "No such command: 'plaing'. Did you mean 'playing'?");
}

TEST_CASE("Nothing is suggested for commands too far off", "[console]") {
    CHECK(noSuchCommandText("xyzzyplugh") == "No such command: 'xyzzyplugh'");
    CHECK(noSuchCommandText("") == "No such command: ''");
}

TEST_CASE("Playing command prints the current song", "[console]") {
    ConfigManager config;
    Client client(marietjeTransport());
    std::ostringstream out, err;

    REQUIRE(Console(config, client, out, err).run(Console::Command::PLAYING, {}) == 0);
    CHECK_THAT(out.str(), Catch::StartsWith("The Beatles - Song 1 (requested by alice) ["));
    CHECK(countLines(out.str()) == 1);
}

TEST_CASE("Queue command lists the requests", "[console]") {
    ConfigManager config;
    Client client(marietjeTransport());
    std::ostringstream out, err;

    REQUIRE(Console(config, client, out, err).run(Console::Command::QUEUE, {}) == 0);
    CHECK(out.str() == "bob: The Beatles - Song 2\n"
                       "marietje: The Beatles - Song 3\n");
}

TEST_CASE("Search command prints the requested number of results", "[console]") {
    ConfigManager config;
    Client client(marietjeTransport(40));
    std::ostringstream out, err;

    REQUIRE(Console(config, client, out, err).run(Console::Command::SEARCH, {"beatles", "30"}) == 0);
    CHECK(countLines(out.str()) == 30);
    CHECK_THAT(out.str(), Catch::StartsWith("m0  The Beatles - Song 0  3:00\n"));
    CHECK(client.query().results().size() == 30);
}

TEST_CASE("Search command stops when the catalogue runs out", "[console]") {
    ConfigManager config;
    Client client(marietjeTransport(12));
    std::ostringstream out, err;

    REQUIRE(Console(config, client, out, err).run(Console::Command::SEARCH, {"beatles"}) == 0);
    CHECK(countLines(out.str()) == 12);
    CHECK(client.query().done());
}

TEST_CASE("Commands check their arguments", "[console]") {
    ConfigManager config;
    Client client(marietjeTransport());
    std::ostringstream out, err;
    Console console(config, client, out, err);

    CHECK(console.run(Console::Command::SEARCH, {}) == 1);
    CHECK(console.run(Console::Command::SEARCH, {"beatles", "many"}) == 1);
    CHECK(console.run(Console::Command::SEARCH, {"beatles", "0"}) == 1);
    CHECK(console.run(Console::Command::SEARCH, {"beatles", "-5"}) == 1);
    CHECK(console.run(Console::Command::SEARCH, {"beatles", "12abc"}) == 1);
    CHECK(console.run(Console::Command::REQUEST, {"m1", "m2"}) == 1);
    // No credentials configured
    CHECK(console.run(Console::Command::REQUEST, {"m1"}) == 1);
    CHECK(out.str().empty());
    CHECK_THAT(err.str(), Catch::Contains("Usage: maruska search"));
}

TEST_CASE("Search command rejects a configured count below one", "[console]") {
    ConfigManager config;
    config.set("search_count", "-3");
    Client client(marietjeTransport());
    std::ostringstream out, err;

    CHECK(Console(config, client, out, err).run(Console::Command::SEARCH, {"beatles"}) == 1);
    CHECK_THAT(err.str(), Catch::Contains("search_count") && Catch::Contains("Usage: maruska search"));
    // Nothing was asked of the server
    CHECK_FALSE(client.query().query());
    CHECK(client.channel().drainOutboundNonBlocking().empty());
}
