
#include <algorithm>
#include <array>
#include <csignal>
#include <numeric>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

#include "comet/comet_error.hpp"
#include "config_manager.hpp"
#include "console.hpp"


// The signals we stop on
static std::array const handledSignals = {SIGINT, SIGTERM};
static std::array<struct sigaction, handledSignals.size()> oldact;

static Console * consoleInstance = nullptr;


using namespace std::literals::chrono_literals;
std::chrono::steady_clock::duration const Console::timeout = 30s;

std::map<std::string, Console::Command> const Console::commands{
    {"watch",   Command::WATCH},
    {"playing", Command::PLAYING},
    {"queue",   Command::QUEUE},
    {"search",  Command::SEARCH},
    {"request", Command::REQUEST}
};


Console::Console(ConfigManager const & config, Client & client, std::ostream & out, std::ostream & err)
 : _config(config), _client(client), _out(out), _err(err), _running(true),
   _command(Command::WATCH), _target(), _count(0), _status(0) {
    if (consoleInstance) {
        spdlog::get("logger")->critical("Running two consoles in the same process will misbehave!!");
    } else {
        spdlog::get("logger")->trace("Registering signal handlers...");

        struct sigaction action;
        action.sa_handler = [](int){ consoleInstance->stop(); };
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        for (unsigned i = 0; i < handledSignals.size(); i++) {
            sigaction(handledSignals[i], &action, &oldact[i]);
        }

        consoleInstance = this;
    }
}

Console::~Console() {
    if (consoleInstance == this) {
        spdlog::get("logger")->trace("Deregistering signal handlers...");

        for (unsigned i = 0; i < handledSignals.size(); i++) {
            sigaction(handledSignals[i], &oldact[i], NULL);
        }

        consoleInstance = nullptr;
    }
}


int Console::run(Command command, std::vector<std::string> const & args) {
    static std::map<Command, Handler> const handlers{
        {Command::WATCH,   &Console::handleWatch},
        {Command::PLAYING, &Console::handlePlaying},
        {Command::QUEUE,   &Console::handleQueue},
        {Command::SEARCH,  &Console::handleSearch},
        {Command::REQUEST, &Console::handleRequest}
    };

    _command = command;
    _status = 0;
    if (!start(args)) return 1;
    Handler const handler = handlers.at(command);

    _client.serve();
    auto const deadline = std::chrono::steady_clock::now() + timeout;

    while (_running) {
        if (_command != Command::WATCH && std::chrono::steady_clock::now() > deadline) {
            _err << "Timed out waiting for the server" << std::endl;
            _status = 1;
            break;
        }

        // Wake up regularly, so a stop request is noticed
        std::optional<CometChannel::Inbound> inbound = _client.inbound().popFor(100ms);
        if (!inbound) {
            if (_client.inbound().closed()) break;
            continue;
        }

        if (inbound->kind == CometChannel::Inbound::Kind::FAULT) {
            _err << "Error: " << inbound->fault << std::endl;
            continue;
        }

        try {
            if ((this->*handler)(_client.handleMessage(inbound->message))) break;

        } catch (MalformedResponse const & e) {
            spdlog::get("logger")->error("Malformed message, no valid \"{}\" in {}", e.field(), e.payload());
            _err << "Error: the server sent a malformed \"" << e.field() << "\"" << std::endl;
        } catch (ProtocolViolation const & e) {
            spdlog::get("logger")->error("{}", e.what());
        }
    }

    spdlog::get("logger")->trace("console.run() done.");
    _client.stop();
    return _status;
}

void Console::stop() {
    _running = false;
}


bool Console::start(std::vector<std::string> const & args) {
    switch (_command) {
        case Command::WATCH:
            _client.followAll();
            return true;

        case Command::PLAYING:
            _client.follow({"playing"});
            return true;

        case Command::QUEUE:
            _client.follow({"requests"});
            return true;

        case Command::SEARCH:
            if (args.empty()) {
                _err << "Usage: maruska search QUERY [COUNT]" << std::endl;
                return false;
            }
            _target = args[0];
            if (args.size() > 1) {
                long count = 0;
                try {
                    std::size_t end;
                    count = std::stol(args[1], &end);
                    if (end != args[1].size()) count = 0;
                } catch (std::logic_error const &) { // What `std::stol` throws
                    count = 0;
                }
                if (count < 1) {
                    _err << "Not a result count: \"" << args[1] << "\"\n"
                         << "Usage: maruska search QUERY [COUNT]" << std::endl;
                    return false;
                }
                _count = count;
            } else {
                int count = _config.getInt("search_count");
                if (count < 1) {
                    _err << "search_count must be at least 1, not " << count << "\n"
                         << "Usage: maruska search QUERY [COUNT]" << std::endl;
                    return false;
                }
                _count = count;
            }
            _client.updateQuery(_target, _count);
            return true;

        case Command::REQUEST: {
            if (args.size() != 1) {
                _err << "Usage: maruska request KEY" << std::endl;
                return false;
            }
            std::string const & username = _config.getStr("username");
            std::string const & accessKey = _config.getStr("access_key");
            std::string const & password = _config.getStr("password");
            if (username.empty() || (accessKey.empty() && password.empty())) {
                _err << "Requesting needs a username, and an access key or password, in the configuration" << std::endl;
                return false;
            }

            _target = args[0];
            _client.follow({"requests"});
            if (_client.requestPlayback(_target) == Client::RequestStatus::DEFERRED) {
                _err << "Logging in as " << username << "..." << std::endl;
                if (!accessKey.empty()) {
                    _client.loginWithAccessKey(username, accessKey);
                } else {
                    _client.loginWithPassword(username, password);
                }
            }
            return true;
        }
    }
    return false;
}


bool Console::handleWatch(InboundMessage const & message) {
    if (std::holds_alternative<PlayingUpdate>(message)) {
        printPlaying();
    } else if (std::holds_alternative<RequestsUpdate>(message)) {
        printQueue();
    }
    return false;
}

bool Console::handlePlaying(InboundMessage const & message) {
    if (!std::holds_alternative<PlayingUpdate>(message)) return false;
    printPlaying();
    return true;
}

bool Console::handleQueue(InboundMessage const & message) {
    if (!std::holds_alternative<RequestsUpdate>(message)) return false;
    printQueue();
    return true;
}

bool Console::handleSearch(InboundMessage const & message) {
    if (!std::holds_alternative<QueryMediaResults>(message)) return false;

    MediaQuery const & query = _client.query();
    if (!query.done() && (query.awaiting() || query.results().size() < _count)) return false;

    if (query.results().empty()) {
        _out << "No results for \"" << _target << "\"" << std::endl;
    }
    for (Media const & media : query.results()) {
        _out << fmt::format("{}  {} - {}  {}", media.key(), media.artist(), media.title(),
                            formatDuration(media.length())) << std::endl;
    }
    return true;
}

bool Console::handleRequest(InboundMessage const & message) {
    if (std::holds_alternative<LoggedIn>(message)) {
        _err << "Successfully logged in" << std::endl;
        return false;
    }
    if (LoginError const * error = std::get_if<LoginError>(&message)) {
        _err << loginErrorText(error->reason, _config.getStr("username")) << std::endl;
        _status = 1;
        return true;
    }

    // The queue update listing our request is the only acknowledgement there is
    if (!std::holds_alternative<RequestsUpdate>(message)
     || _client.loginState() != Client::LoginState::LOGGED_IN) return false;
    for (Request const & request : *_client.requests()) {
        if (request.media().key() == _target) {
            _out << "Requested " << request.media().artist() << " - " << request.media().title() << std::endl;
            return true;
        }
    }
    return false;
}


void Console::printPlaying() {
    std::optional<Playing> const & playing = _client.playing();
    if (!playing) {
        _out << "Nothing is playing" << std::endl;
        return;
    }

    Media const & media = playing->media();
    _out << media.artist() << " - " << media.title();
    if (playing->byKey()) {
        _out << " (requested by " << *playing->byKey() << ")";
    } else {
        _out << " (requested at random by the server)";
    }
    _out << " [" << formatDuration(playing->remaining(_client.playingReceivedAt(), std::chrono::system_clock::now())) << " left]" << std::endl;
}

void Console::printQueue() {
    std::optional<std::vector<Request>> const & requests = _client.requests();
    if (!requests || requests->empty()) {
        _out << "The queue is empty" << std::endl;
        return;
    }

    for (Request const & request : *requests) {
        _out << request.byKey().value_or("marietje") << ": "
             << request.media().artist() << " - " << request.media().title() << std::endl;
    }
}


std::string formatDuration(std::chrono::nanoseconds duration) {
    auto const seconds = std::chrono::duration_cast<std::chrono::seconds>(duration).count();
    if (seconds >= 3600) {
        return fmt::format("{}:{:02}:{:02}", seconds / 3600, seconds / 60 % 60, seconds % 60);
    }
    return fmt::format("{}:{:02}", seconds / 60, seconds % 60);
}

// Levenshtein distance
std::size_t editDistance(std::string const & a, std::string const & b) {
    std::vector<std::size_t> row(b.size() + 1);
    std::iota(row.begin(), row.end(), 0);
    for (std::size_t i = 1; i <= a.size(); i++) {
        std::size_t diagonal = row[0];
        row[0] = i;
        for (std::size_t j = 1; j <= b.size(); j++) {
            std::size_t const above = row[j];
            row[j] = std::min({above + 1, row[j - 1] + 1, diagonal + (a[i - 1] != b[j - 1])});
            diagonal = above;
        }
    }
    return row[b.size()];
}

std::string noSuchCommandText(std::string const & name) {
    static std::size_t const maxDistance = 3;

    std::optional<std::pair<std::string, std::size_t>> closest;
    for (auto const & [command, value] : Console::commands) {
        std::size_t const distance = editDistance(name, command);
        if (distance <= maxDistance && (!closest || distance < closest->second)) {
            closest.emplace(command, distance);
        }
    }

    if (!closest) return "No such command: '" + name + "'";
    return "No such command: '" + name + "'. Did you mean '" + closest->first + "'?";
}

std::string loginErrorText(std::string const & reason, std::string const & username) {
    if (reason == "User does not exist") {
        return "Login failed: user \"" + username + "\" does not exist";
    }
    if (reason == "Wrong password") {
        return "Login failed: wrong password";
    }
    return "Login failed: " + reason;
}
