#ifndef COMET_ERROR_HPP
#define COMET_ERROR_HPP

#include <stdexcept>
#include <string>


class CometError : public std::runtime_error {
public:
    CometError(std::string const & what) : std::runtime_error("comet error: " + what) {}
};

// Network failure, non-2xx response, or a body that isn't JSON at all
class TransportError : public CometError {
    long _status; // HTTP status, 0 if no response was received

public:
    TransportError(std::string const & what, long status = 0)
     : CometError(what + (status ? " (HTTP " + std::to_string(status) + ")" : "")),
       _status(status) {}

    long status() const { return _status; }
};

// The frame or a message in it does not have the expected shape
class MalformedResponse : public CometError {
    std::string _field;
    std::string _payload;

public:
    MalformedResponse(std::string const & field, std::string const & payload)
     : CometError("malformed response: found no valid \"" + field + "\" in " + payload),
       _field(field), _payload(payload) {}

    std::string const & field() const { return _field; }
    std::string const & payload() const { return _payload; }
};


#endif
