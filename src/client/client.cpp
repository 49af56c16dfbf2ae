
#include <spdlog/spdlog.h>
#include <stdexcept>

#include "client.hpp"
#include "md5.hpp"


std::set<std::string> const Client::followableTopics{"playing", "requests"};


Client::Client(std::unique_ptr<HttpTransport> transport, CometChannel::RetryPolicy const & retry)
 : _channel(std::move(transport), retry), _playing(), _playingReceivedAt(), _requests(),
   _loginState(LoginState::NO_TOKEN), _loginToken(), _accessKey(), _pendingLogin(),
   _deferredAfterLogin(), _query() {}


void Client::sendMessage(nlohmann::json message) {
    spdlog::get("logger")->trace("Queuing message {}", message.dump());
    _channel.enqueue(std::move(message));
}


InboundMessage Client::handleMessage(nlohmann::json const & message) {
    InboundMessage decoded = decodeMessage(message);
    std::visit([this](auto const & alternative) { apply(alternative); }, decoded);
    return decoded;
}

void Client::apply(Welcome const &) {
    spdlog::get("logger")->debug("Server says welcome");
}

void Client::apply(PlayingUpdate const & message) {
    _playing = message.playing;
    _playingReceivedAt = std::chrono::system_clock::now();
    if (_playing) {
        spdlog::get("logger")->debug("Now playing: {} - {}", _playing->media().artist(), _playing->media().title());
    } else {
        spdlog::get("logger")->debug("Nothing playing");
    }
}

void Client::apply(RequestsUpdate const & message) {
    _requests = message.requests;
    spdlog::get("logger")->debug("{} requests queued", _requests->size());
}

void Client::apply(LoginToken const & message) {
    _loginToken = message.token;
    _loginState = LoginState::TOKEN_READY;
    spdlog::get("logger")->debug("Got login token");

    if (_pendingLogin) {
        PendingLogin pending = *_pendingLogin;
        login(pending.username, pending.secret, pending.usingAccessKey);
    }
}

void Client::apply(LoggedIn const & message) {
    _accessKey = message.accessKey;
    _loginState = LoginState::LOGGED_IN;

    // Take the whole queue first, so it is emptied at once
    std::vector<nlohmann::json> deferred;
    deferred.swap(_deferredAfterLogin);
    spdlog::get("logger")->debug("Logged in, sending {} deferred messages", deferred.size());
    for (nlohmann::json & pending : deferred) {
        sendMessage(std::move(pending));
    }
}

void Client::apply(LoginError const & message) {
    spdlog::get("logger")->warn("Login failed: {}", message.reason);
    _loginState = _loginToken ? LoginState::TOKEN_READY : LoginState::NO_TOKEN;
}

void Client::apply(QueryMediaResults const & message) {
    if (_query.handleResults(message.token, message.results) == MediaQuery::Outcome::ACCEPTED) {
        maybeQueryMedia();
    }
}

void Client::apply(UnknownMessage const & message) {
    spdlog::get("logger")->warn("Ignoring message of unknown type \"{}\"", message.type);
}


void Client::follow(std::vector<std::string> const & topics) {
    for (std::string const & topic : topics) {
        if (followableTopics.find(topic) == followableTopics.end()) {
            throw std::invalid_argument("Cannot follow \"" + topic + "\"");
        }
    }
    sendMessage({{"type", "follow"}, {"which", topics}});
}


void Client::requestLoginToken() {
    if (_loginState == LoginState::TOKEN_REQUESTED) return;
    _loginState = LoginState::TOKEN_REQUESTED;
    sendMessage({{"type", "request_login_token"}});
}

void Client::login(std::string const & username, std::string const & secret, bool usingAccessKey) {
    if (!_loginToken) {
        _pendingLogin = PendingLogin{username, secret, usingAccessKey};
        requestLoginToken();
        return;
    }

    _pendingLogin.reset();
    std::string const hash = usingAccessKey ? md5Hex(secret + *_loginToken)
                                            : md5Hex(md5Hex(secret) + *_loginToken);
    _loginState = LoginState::LOGGING_IN;
    spdlog::get("logger")->debug("Logging in as {} (using {})", username, usingAccessKey ? "access key" : "password");
    sendMessage({
        {"type", usingAccessKey ? "login_accessKey" : "login"},
        {"username", username},
        {"hash", hash}
    });
}


void Client::updateQuery(std::optional<std::string> const & query, std::size_t desiredCount) {
    if (_query.update(query, desiredCount)) maybeQueryMedia();
}

void Client::maybeQueryMedia() {
    std::optional<MediaQuery::Chunk> chunk = _query.nextChunk();
    if (!chunk) return;

    sendMessage({
        {"type", "query_media"},
        {"query", chunk->query},
        {"token", chunk->token},
        {"skip", chunk->skip},
        {"count", chunk->count}
    });
}


Client::RequestStatus Client::requestPlayback(std::string const & mediaKey) {
    nlohmann::json message{{"type", "request"}, {"mediaKey", mediaKey}};
    if (_loginState == LoginState::LOGGED_IN) {
        sendMessage(std::move(message));
        return RequestStatus::OK;
    }

    spdlog::get("logger")->debug("Not logged in, deferring request for {}", mediaKey);
    _deferredAfterLogin.push_back(std::move(message));
    return RequestStatus::DEFERRED;
}
