
#include "comet_error.hpp"
#include "wire.hpp"


std::string wire::encodeFrame(std::optional<std::string> const & sessionId,
                              std::vector<nlohmann::json> const & messages) {
    nlohmann::json frame = nlohmann::json::array();
    if (sessionId) frame.push_back(*sessionId);
    for (nlohmann::json const & message : messages) {
        frame.push_back(message);
    }
    return frame.dump();
}

wire::InboundFrame wire::decodeFrame(std::string const & body) {
    nlohmann::json frame;
    try {
        frame = nlohmann::json::parse(body);
    } catch (nlohmann::json::parse_error const & e) {
        throw TransportError(std::string("response is not JSON: ") + e.what());
    }

    if (!frame.is_array() || frame.size() < 1 || !frame[0].is_string()
     || frame[0].get_ref<std::string const &>().empty()) {
        throw MalformedResponse("session id", body);
    }
    if (frame.size() < 2 || !frame[1].is_array()) {
        throw MalformedResponse("messages", body);
    }

    InboundFrame decoded{frame[0].get<std::string>(), {}};
    decoded.messages.reserve(frame[1].size());
    for (nlohmann::json & message : frame[1]) {
        decoded.messages.push_back(std::move(message));
    }
    return decoded;
}

std::string wire::messageType(nlohmann::json const & message) {
    if (!message.is_object()) throw MalformedResponse("type", message.dump());
    auto type = message.find("type");
    if (type == message.end() || !type->is_string()) {
        throw MalformedResponse("type", message.dump());
    }
    return type->get<std::string>();
}
