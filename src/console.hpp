#ifndef CONSOLE_HPP
#define CONSOLE_HPP

#include <atomic>
#include <chrono>
#include <map>
#include <ostream>
#include <string>
#include <vector>

#include "client/client.hpp"


class ConfigManager;

// Line-oriented frontend: runs one command against the server and prints the outcome
class Console {
public:
    enum class Command { WATCH, PLAYING, QUEUE, SEARCH, REQUEST };

    static std::map<std::string, Command> const commands;
    // How long one-shot commands may wait for the server
    static std::chrono::steady_clock::duration const timeout;

private:
    using Handler = bool (Console::*)(InboundMessage const &);

    ConfigManager const & _config;
    Client & _client;
    std::ostream & _out;
    std::ostream & _err;

    std::atomic_bool _running; // Set to false when we receive SIGINT or SIGTERM

    Command _command;
    std::string _target; // Query or media key, depending on the command
    std::size_t _count;
    int _status; // Exit status

public:
    Console(ConfigManager const & config, Client & client, std::ostream & out, std::ostream & err);
    ~Console();

    // Returns the process exit status
    int run(Command command, std::vector<std::string> const & args);
    void stop(); // Signals the loop to stop, but doesn't kill it immediately

private:
    bool start(std::vector<std::string> const & args);

    // Each returns true once the command is complete
    bool handleWatch(InboundMessage const & message);
    bool handlePlaying(InboundMessage const & message);
    bool handleQueue(InboundMessage const & message);
    bool handleSearch(InboundMessage const & message);
    bool handleRequest(InboundMessage const & message);

    void printPlaying();
    void printQueue();
};

std::string formatDuration(std::chrono::nanoseconds duration);
std::size_t editDistance(std::string const & a, std::string const & b);
// Suggests the closest command, if one is close enough
std::string noSuchCommandText(std::string const & name);
std::string loginErrorText(std::string const & reason, std::string const & username);


#endif
