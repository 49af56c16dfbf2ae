
#include <algorithm>
#include <spdlog/spdlog.h>
#include <stdexcept>

#include "comet_channel.hpp"
#include "comet_error.hpp"
#include "wire.hpp"


// Holds one of the `maxOutstanding` request slots, and gives it back when destroyed
class CometChannel::RequestSlot {
    CometChannel & _channel;

public:
    RequestSlot(CometChannel & channel) : _channel(channel) {}
    ~RequestSlot() { _channel.releaseSlot(); }
};


CometChannel::CometChannel(std::unique_ptr<HttpTransport> transport, RetryPolicy const & retry)
 : _transport(std::move(transport)), _retry(retry), _sessionId(), _outstanding(0),
   _outbound(), _inbound(), _running(false) {
    connect();
}

CometChannel::~CometChannel() {
    stop();
}


void CometChannel::connect() {
    {
        std::lock_guard lock(_stateMutex);
        if (_outstanding != 0) throw std::logic_error("Cannot connect while requests are outstanding");
        if (_sessionId) throw std::logic_error("Comet channel is already connected");
    }

    spdlog::get("logger")->info("Connecting to {}", url());
    send({});
    spdlog::get("logger")->info("Connected to {} (session {})", url(), sessionId().value_or(""));
}

void CometChannel::serve() {
    if (!sessionId()) throw std::logic_error("Cannot serve a comet channel that isn't connected");
    if (!_workers.empty()) throw std::logic_error("Comet channel is already being served");

    _running = true;
    for (unsigned i = 0; i < nbWorkers; i++) {
        _workers.emplace_back([this, i]() { work(i); });
    }
}

void CometChannel::stop() {
    {
        std::lock_guard lock(_stopMutex);
        _running = false;
    }
    _stopped.notify_all();
    _outbound.close(); // Wakes workers waiting for something to send
    _transport->cancel(); // Aborts the long poll

    if (!_workers.empty()) {
        spdlog::get("logger")->trace("Joining comet workers...");
        for (std::thread & worker : _workers) worker.join();
        _workers.clear();
    }
    _inbound.close();
}


void CometChannel::send(std::vector<nlohmann::json> const & messages) {
    {
        std::lock_guard lock(_stateMutex);
        if (_outstanding >= maxOutstanding) {
            throw std::logic_error("More than " + std::to_string(maxOutstanding) + " comet requests at once");
        }
        ++_outstanding;
    }
    RequestSlot slot(*this);
    exchange(messages);
}

bool CometChannel::pollIfIdle() {
    {
        std::lock_guard lock(_stateMutex);
        if (_outstanding != 0) return false;
        ++_outstanding;
    }
    RequestSlot slot(*this);
    exchange({});
    return true;
}

void CometChannel::releaseSlot() {
    std::lock_guard lock(_stateMutex);
    --_outstanding;
}


void CometChannel::exchange(std::vector<nlohmann::json> const & messages) {
    std::string const request = wire::encodeFrame(sessionId(), messages);
    spdlog::get("logger")->trace("sending packet: {}", request);
    std::string const response = _transport->post(request);
    spdlog::get("logger")->trace("received packet: {}", response);

    wire::InboundFrame frame = wire::decodeFrame(response);
    {
        std::lock_guard lock(_stateMutex);
        if (_sessionId && *_sessionId != frame.sessionId) {
            spdlog::get("logger")->debug("Comet session changed from {} to {}", *_sessionId, frame.sessionId);
        }
        _sessionId = frame.sessionId;
    }

    for (nlohmann::json & message : frame.messages) {
        _inbound.push(Inbound{Inbound::Kind::MESSAGE, std::move(message), {}});
    }
}


void CometChannel::work(unsigned id) {
    spdlog::get("logger")->debug("Comet worker {} up and running", id);

    std::vector<nlohmann::json> batch; // Kept across transport failures, so it gets resent
    std::chrono::milliseconds delay = _retry.initialDelay;

    while (_running) {
        try {
            if (batch.empty()) batch = drainOutboundNonBlocking();

            if (!batch.empty()) {
                send(batch);
            } else if (!pollIfIdle()) {
                // The other worker is busy, so it will renew the long poll; wait for work instead
                std::optional<nlohmann::json> message = awaitOutboundBlocking();
                if (!message) break; // The outbound queue was closed
                batch.push_back(std::move(*message));
                send(batch);
            }
            batch.clear();
            delay = _retry.initialDelay;

        } catch (TransportError const & e) {
            if (!_running) break;
            spdlog::get("logger")->warn("Comet worker {}: {}; retrying in {} ms", id, e.what(), delay.count());
            waitBeforeRetry(delay);
            delay = std::min(delay * 2, _retry.maxDelay);

        } catch (MalformedResponse const & e) {
            // The server got the batch, so it isn't resent
            spdlog::get("logger")->error("Comet worker {}: malformed response, no valid \"{}\" in {}",
                                         id, e.field(), e.payload());
            _inbound.push(Inbound{Inbound::Kind::FAULT, nullptr, e.what()});
            batch.clear();

        } catch (std::exception const & e) {
            spdlog::get("logger")->error("Comet worker {}: Exception at top level: {}", id, e.what());
            _inbound.push(Inbound{Inbound::Kind::FAULT, nullptr, e.what()});
            break;
        }
    }

    spdlog::get("logger")->debug("Comet worker {} done.", id);
}

void CometChannel::waitBeforeRetry(std::chrono::milliseconds delay) {
    std::unique_lock lock(_stopMutex);
    _stopped.wait_for(lock, delay, [this]() { return !_running; });
}


std::optional<std::string> CometChannel::sessionId() const {
    std::lock_guard lock(_stateMutex);
    return _sessionId;
}

unsigned CometChannel::outstandingRequests() const {
    std::lock_guard lock(_stateMutex);
    return _outstanding;
}
