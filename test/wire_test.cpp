#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "comet/comet_error.hpp"
#include "comet/wire.hpp"


TEST_CASE("Handshake frame is an empty array", "[wire]") {
    REQUIRE(wire::encodeFrame(std::nullopt, {}) == "[]");
}

TEST_CASE("Outbound frame starts with the session id", "[wire]") {
    std::string const frame = wire::encodeFrame(std::string("s1"), {
        {{"type", "follow"}, {"which", {"playing"}}},
        {{"type", "request_login_token"}}
    });

    nlohmann::json const decoded = nlohmann::json::parse(frame);
    REQUIRE(decoded.size() == 3);
    CHECK(decoded[0] == "s1");
    CHECK(decoded[1]["type"] == "follow");
    CHECK(decoded[2]["type"] == "request_login_token");
}

TEST_CASE("Empty poll only carries the session id", "[wire]") {
    REQUIRE(wire::encodeFrame(std::string("s1"), {}) == R"(["s1"])");
}

TEST_CASE("Inbound frame is decoded in order", "[wire]") {
    wire::InboundFrame frame = wire::decodeFrame(R"(["s2",[{"type":"welcome"},{"type":"playing"}]])");

    CHECK(frame.sessionId == "s2");
    REQUIRE(frame.messages.size() == 2);
    CHECK(frame.messages[0]["type"] == "welcome");
    CHECK(frame.messages[1]["type"] == "playing");
}

TEST_CASE("Inbound frame may carry no messages", "[wire]") {
    wire::InboundFrame frame = wire::decodeFrame(R"(["s1",[]])");
    CHECK(frame.sessionId == "s1");
    CHECK(frame.messages.empty());
}

TEST_CASE("Body that isn't JSON is a transport error", "[wire]") {
    REQUIRE_THROWS_AS(wire::decodeFrame("<html>502 Bad Gateway</html>"), TransportError);
    REQUIRE_THROWS_AS(wire::decodeFrame(""), TransportError);
}

TEST_CASE("Frames with the wrong shape are malformed", "[wire]") {
    auto fieldOf = [](std::string const & body) {
        try {
            wire::decodeFrame(body);
        } catch (MalformedResponse const & e) {
            CHECK(e.payload() == body);
            return e.field();
        }
        FAIL("No MalformedResponse thrown for " << body);
        return std::string();
    };

    CHECK(fieldOf("[]") == "session id");
    CHECK(fieldOf(R"({"session":"s1"})") == "session id");
    CHECK(fieldOf(R"([42,[]])") == "session id");
    CHECK(fieldOf(R"(["",[]])") == "session id");
    CHECK(fieldOf(R"(["s1"])") == "messages");
    CHECK(fieldOf(R"(["s1",{"type":"welcome"}])") == "messages");
}

TEST_CASE("Message type is read from the envelope", "[wire]") {
    CHECK(wire::messageType({{"type", "welcome"}}) == "welcome");

    REQUIRE_THROWS_AS(wire::messageType({{"kind", "welcome"}}), MalformedResponse);
    REQUIRE_THROWS_AS(wire::messageType({{"type", 3}}), MalformedResponse);
    REQUIRE_THROWS_AS(wire::messageType(nlohmann::json::array()), MalformedResponse);
}
