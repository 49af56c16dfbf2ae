
#include <map>

#include "../comet/comet_error.hpp"
#include "../comet/wire.hpp"
#include "inbound_message.hpp"


template<typename T>
static T field(nlohmann::json const & message, char const * name) {
    try {
        return message.at(name).get<T>();
    } catch (nlohmann::json::exception const &) {
        throw MalformedResponse(name, message.dump());
    }
}


using Decoder = InboundMessage (*)(nlohmann::json const & message);

static std::map<std::string, Decoder> const decoders{
    {"welcome", [](nlohmann::json const &) -> InboundMessage {
        return Welcome{};
    }},

    {"playing", [](nlohmann::json const & message) -> InboundMessage {
        auto iter = message.find("playing");
        if (iter == message.end() || iter->is_null()) return PlayingUpdate{std::nullopt};
        return PlayingUpdate{field<Playing>(message, "playing")};
    }},

    {"requests", [](nlohmann::json const & message) -> InboundMessage {
        if (!message.contains("requests") || !message["requests"].is_array()) {
            throw MalformedResponse("requests", message.dump());
        }
        return RequestsUpdate{field<std::vector<Request>>(message, "requests")};
    }},

    {"login_token", [](nlohmann::json const & message) -> InboundMessage {
        return LoginToken{field<std::string>(message, "login_token")};
    }},

    {"logged_in", [](nlohmann::json const & message) -> InboundMessage {
        return LoggedIn{field<std::string>(message, "accessKey")};
    }},

    {"error_login", [](nlohmann::json const & message) -> InboundMessage {
        return LoginError{field<std::string>(message, "message")};
    }},

    {"query_media_results", [](nlohmann::json const & message) -> InboundMessage {
        if (!message.contains("token") || !message["token"].is_number_unsigned()) {
            throw MalformedResponse("token", message.dump());
        }
        if (!message.contains("results") || !message["results"].is_array()) {
            throw MalformedResponse("results", message.dump());
        }
        return QueryMediaResults{field<uint64_t>(message, "token"),
                                 field<std::vector<Media>>(message, "results")};
    }}
};

InboundMessage decodeMessage(nlohmann::json const & message) {
    std::string type = wire::messageType(message);

    auto decoder = decoders.find(type);
    if (decoder == decoders.end()) return UnknownMessage{type};
    return decoder->second(message);
}
