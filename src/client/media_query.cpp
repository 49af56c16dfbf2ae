
#include <algorithm>
#include <iterator>
#include <spdlog/spdlog.h>

#include "media_query.hpp"


MediaQuery::MediaQuery()
 : _query(), _desiredCount(0), _results(), _done(false),
   _token(0), _awaited(), _awaitedCount(0) {}


// Small chunks first so the first results show up quickly, then bigger ones to save round trips
std::size_t MediaQuery::chunkSize(std::size_t nbResults) {
    if (nbResults <= 50) return 25;
    if (nbResults <= 100) return 50;
    if (nbResults <= 200) return 100;
    if (nbResults <= 500) return 1000 - nbResults;
    return 1000;
}


bool MediaQuery::update(std::optional<std::string> const & query, std::size_t desiredCount) {
    if (query == _query) {
        // The window only ever grows for a given query
        if (desiredCount <= _desiredCount) return false;
        _desiredCount = desiredCount;
        return true;
    }

    spdlog::get("logger")->debug("New media query \"{}\" (previous token {})", query.value_or(""), _token);
    _query = query;
    _desiredCount = desiredCount;
    _results.clear();
    _done = false;
    _awaited.reset(); // Whatever is in flight now answers the old query
    _awaitedCount = 0;
    return true;
}

std::optional<MediaQuery::Chunk> MediaQuery::nextChunk() {
    if (_done || !_query || _awaited || _results.size() >= _desiredCount) return std::nullopt;

    std::size_t const skip = _results.size();
    std::size_t const count = std::min(_desiredCount - skip, chunkSize(skip));

    ++_token;
    _awaited = _token;
    _awaitedCount = count;
    return Chunk{*_query, _token, skip, count};
}

MediaQuery::Outcome MediaQuery::handleResults(uint64_t token, std::vector<Media> results) {
    if (token > _token) {
        throw ProtocolViolation("query_media_results token " + std::to_string(token)
                                + " is newer than the last one issued (" + std::to_string(_token) + ")");
    }
    if (!_awaited || token != *_awaited) {
        spdlog::get("logger")->debug("Ignoring stale query_media_results (token {}, awaiting {})",
                                     token, _awaited ? std::to_string(*_awaited) : "none");
        return Outcome::STALE;
    }

    _awaited.reset();
    std::size_t const returned = results.size();
    std::move(results.begin(), results.end(), std::back_inserter(_results));

    if (returned < _awaitedCount) {
        _done = true;
        spdlog::get("logger")->debug("Media query \"{}\" exhausted at {} results", _query.value_or(""), _results.size());
        return Outcome::EXHAUSTED;
    }
    return Outcome::ACCEPTED;
}
