#ifndef HTTP_TRANSPORT_HPP
#define HTTP_TRANSPORT_HPP

#include <string>


// Performs the actual POSTs to the comet endpoint
// `post` is called concurrently by the channel's workers, so implementations must be thread-safe
/* abstract */ class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Returns the response body; throws `TransportError` on failure or non-2xx status
    virtual std::string post(std::string const & body) = 0;
    // Aborts requests in flight and fails all later ones
    virtual void cancel() = 0;

    virtual std::string const & url() const = 0;
};


#endif
