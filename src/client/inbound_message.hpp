#ifndef INBOUND_MESSAGE_HPP
#define INBOUND_MESSAGE_HPP

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../media/media.hpp"


struct Welcome {};

struct PlayingUpdate {
    std::optional<Playing> playing; // Empty when nothing is playing
};

struct RequestsUpdate {
    std::vector<Request> requests;
};

struct LoginToken {
    std::string token;
};

struct LoggedIn {
    std::string accessKey;
};

struct LoginError {
    std::string reason;
};

struct QueryMediaResults {
    uint64_t token;
    std::vector<Media> results;
};

// A `type` this client doesn't know about; logged and skipped
struct UnknownMessage {
    std::string type;
};

using InboundMessage = std::variant<Welcome, PlayingUpdate, RequestsUpdate, LoginToken, LoggedIn,
                                    LoginError, QueryMediaResults, UnknownMessage>;

// Throws `MalformedResponse` naming the offending field if a known message lacks one
InboundMessage decodeMessage(nlohmann::json const & message);


#endif
