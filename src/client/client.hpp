#ifndef CLIENT_HPP
#define CLIENT_HPP

#include <chrono>
#include <cstddef>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../comet/comet_channel.hpp"
#include "../media/media.hpp"
#include "inbound_message.hpp"
#include "media_query.hpp"


// Protocol state on top of a comet channel
//
// Not thread-safe: the API and `handleMessage` are meant to be called from one thread, the one
// consuming `inbound()`. Only the channel's workers run concurrently.
class Client {
public:
    enum class LoginState { NO_TOKEN, TOKEN_REQUESTED, TOKEN_READY, LOGGING_IN, LOGGED_IN };
    enum class RequestStatus { OK, DEFERRED };

    static std::set<std::string> const followableTopics;

private:
    // Credentials waiting for a login token to arrive
    struct PendingLogin {
        std::string username;
        std::string secret;
        bool usingAccessKey;
    };

    CometChannel _channel;

    std::optional<Playing> _playing;
    std::chrono::system_clock::time_point _playingReceivedAt;
    std::optional<std::vector<Request>> _requests;

    LoginState _loginState;
    std::optional<std::string> _loginToken;
    std::optional<std::string> _accessKey;
    std::optional<PendingLogin> _pendingLogin;
    std::vector<nlohmann::json> _deferredAfterLogin; // Sent in order once logged in

    MediaQuery _query;

public:
    // Connects right away; throws `CometError` if the handshake fails
    Client(std::unique_ptr<HttpTransport> transport, CometChannel::RetryPolicy const & retry = {});

    void serve() { _channel.serve(); }
    void stop() { _channel.stop(); }
    CometChannel & channel() { return _channel; }
    MessageQueue<CometChannel::Inbound> & inbound() { return _channel.inbound(); }

    // Applies one message from the inbound stream, and returns it decoded
    // Throws `MalformedResponse` if the message can't be decoded, `ProtocolViolation` if it
    // answers a search request that was never made; the state is left untouched in both cases
    InboundMessage handleMessage(nlohmann::json const & message);

    // `topics` must only contain elements of `followableTopics`
    void follow(std::vector<std::string> const & topics);
    void followAll() { follow({followableTopics.begin(), followableTopics.end()}); }

    void requestLoginToken();
    // Deferred until a login token is available
    void login(std::string const & username, std::string const & secret, bool usingAccessKey);
    void loginWithPassword(std::string const & username, std::string const & password) {
        login(username, password, false);
    }
    void loginWithAccessKey(std::string const & username, std::string const & accessKey) {
        login(username, accessKey, true);
    }

    // A different query (including none) starts over; the same query can only grow its window
    void updateQuery(std::optional<std::string> const & query, std::size_t desiredCount);
    void maybeQueryMedia();

    // Deferred until logged in, in which case the caller should get the user to log in
    RequestStatus requestPlayback(std::string const & mediaKey);
    RequestStatus requestPlayback(Media const & media) { return requestPlayback(media.key()); }

    std::optional<Playing> const & playing() const { return _playing; }
    std::chrono::system_clock::time_point playingReceivedAt() const { return _playingReceivedAt; }
    std::optional<std::vector<Request>> const & requests() const { return _requests; }
    MediaQuery const & query() const { return _query; }
    LoginState loginState() const { return _loginState; }
    std::optional<std::string> const & accessKey() const { return _accessKey; }
    std::size_t deferredCount() const { return _deferredAfterLogin.size(); }

private:
    void sendMessage(nlohmann::json message);

    void apply(Welcome const & message);
    void apply(PlayingUpdate const & message);
    void apply(RequestsUpdate const & message);
    void apply(LoginToken const & message);
    void apply(LoggedIn const & message);
    void apply(LoginError const & message);
    void apply(QueryMediaResults const & message);
    void apply(UnknownMessage const & message);
};


#endif
