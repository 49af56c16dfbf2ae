#ifndef WIRE_HPP
#define WIRE_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>


// Frames exchanged with the comet endpoint
//   outbound: [sessionId?, message, message, ...]
//   inbound:  [sessionId, [message, message, ...]]
namespace wire {

struct InboundFrame {
    std::string sessionId;
    std::vector<nlohmann::json> messages;
};

std::string encodeFrame(std::optional<std::string> const & sessionId,
                        std::vector<nlohmann::json> const & messages);

// Throws `TransportError` if the body isn't JSON, `MalformedResponse` if the shape is wrong
InboundFrame decodeFrame(std::string const & body);

// Returns the `type` field of a message envelope; throws `MalformedResponse` if there is none
std::string messageType(nlohmann::json const & message);

}


#endif
