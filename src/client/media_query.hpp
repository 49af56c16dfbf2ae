#ifndef MEDIA_QUERY_HPP
#define MEDIA_QUERY_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../media/media.hpp"


// A response carried a token that was never issued
class ProtocolViolation : public std::logic_error {
public:
    ProtocolViolation(std::string const & what) : std::logic_error("protocol violation: " + what) {}
};


// State of the paginated `query_media` search
//
// Results are fetched in chunks, each request tagged with a fresh token; only the response to the
// latest request is accepted, so answers to an earlier query can't pollute the current one.
class MediaQuery {
public:
    // Parameters of one `query_media` request
    struct Chunk {
        std::string query;
        uint64_t token;
        std::size_t skip;
        std::size_t count;
    };

    enum class Outcome {
        STALE,    // Answer to an older request, ignored
        ACCEPTED, // Results appended, more may be available
        EXHAUSTED // Fewer results than requested came back, there are no more
    };

private:
    std::optional<std::string> _query;
    std::size_t _desiredCount;
    std::vector<Media> _results;
    bool _done;

    uint64_t _token; // Last token issued; never reset, even when the query changes
    std::optional<uint64_t> _awaited; // Token of the request in flight for this query, if any
    std::size_t _awaitedCount; // How many results that request asked for

public:
    MediaQuery();

    static std::size_t chunkSize(std::size_t nbResults);

    // Returns true if there may be something new to fetch
    bool update(std::optional<std::string> const & query, std::size_t desiredCount);
    // The next request to make, if one is needed; it becomes the awaited one
    std::optional<Chunk> nextChunk();
    // Throws `ProtocolViolation` if `token` is newer than any issued, without changing anything
    Outcome handleResults(uint64_t token, std::vector<Media> results);

    std::optional<std::string> const & query() const { return _query; }
    std::size_t desiredCount() const { return _desiredCount; }
    std::vector<Media> const & results() const { return _results; }
    bool done() const { return _done; }
    uint64_t token() const { return _token; }
    bool awaiting() const { return _awaited.has_value(); }
};


#endif
