#ifndef COMET_CHANNEL_HPP
#define COMET_CHANNEL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "http_transport.hpp"
#include "message_queue.hpp"


// Emulates a persistent duplex connection over HTTP long-polling
//
// Outbound messages are queued with `enqueue` and batched into POSTs by two workers; one of them
// keeps a long poll open whenever there is nothing to send. Messages found in responses are
// pushed, in order, to the `inbound` stream.
class CometChannel {
public:
    static unsigned constexpr nbWorkers = 2;
    static unsigned constexpr maxOutstanding = 2;

    // Item of the inbound stream
    struct Inbound {
        enum class Kind { MESSAGE, FAULT };

        Kind kind;
        nlohmann::json message; // Valid when `kind == MESSAGE`
        std::string fault; // Human-readable description when `kind == FAULT`
    };

    // How workers wait before resending after a `TransportError`
    struct RetryPolicy {
        std::chrono::milliseconds initialDelay{500};
        std::chrono::milliseconds maxDelay{30000};
    };

private:
    class RequestSlot;

    std::unique_ptr<HttpTransport> _transport;
    RetryPolicy _retry;

    mutable std::mutex _stateMutex; // Guards the session ID and the outstanding request count
    std::optional<std::string> _sessionId;
    unsigned _outstanding;

    MessageQueue<nlohmann::json> _outbound;
    MessageQueue<Inbound> _inbound;

    std::atomic_bool _running;
    std::mutex _stopMutex;
    std::condition_variable _stopped; // Wakes workers sleeping before a retry
    std::vector<std::thread> _workers;

public:
    // Performs the handshake; throws if it fails
    CometChannel(std::unique_ptr<HttpTransport> transport, RetryPolicy const & retry);
    ~CometChannel();

    CometChannel(CometChannel const &) = delete;
    CometChannel & operator=(CometChannel const &) = delete;

    void connect();
    void serve(); // Starts the workers
    void stop(); // Stops and joins the workers, then closes the inbound stream

    void enqueue(nlohmann::json message) { _outbound.push(std::move(message)); }
    MessageQueue<Inbound> & inbound() { return _inbound; }

    // POSTs one batch and forwards the messages of the response
    void send(std::vector<nlohmann::json> const & messages);
    // Issues an empty long poll, only if no other request is outstanding; returns whether it did
    bool pollIfIdle();
    // All queued outbound messages, or an empty batch if there are none; never blocks
    std::vector<nlohmann::json> drainOutboundNonBlocking() { return _outbound.drain(); }
    // Waits for one outbound message; `nullopt` once the channel is stopping
    std::optional<nlohmann::json> awaitOutboundBlocking() { return _outbound.pop(); }

    std::optional<std::string> sessionId() const;
    unsigned outstandingRequests() const;
    std::string const & url() const { return _transport->url(); }

private:
    void exchange(std::vector<nlohmann::json> const & messages);
    void work(unsigned id);
    void waitBeforeRetry(std::chrono::milliseconds delay);
    void releaseSlot();
};


#endif
