#ifndef CURL_TRANSPORT_HPP
#define CURL_TRANSPORT_HPP

#include <atomic>
#include <chrono>
#include <string>

#include "http_transport.hpp"


// `curl_global_init` is not thread-safe, so this must live in `main` before any thread starts
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(CurlGlobal const &) = delete;
    CurlGlobal & operator=(CurlGlobal const &) = delete;
};


class CurlTransport : public HttpTransport {
public:
    static char const * const userAgent;

private:
    std::string _url;
    std::chrono::seconds _connectTimeout;
    std::chrono::seconds _requestTimeout; // Zero means no limit; long polls end server-side
    std::atomic_bool _cancelled;

public:
    CurlTransport(std::string const & url, std::chrono::seconds connectTimeout,
                  std::chrono::seconds requestTimeout);

    std::string post(std::string const & body) override;
    void cancel() override { _cancelled = true; }
    bool cancelled() const { return _cancelled; }

    std::string const & url() const override { return _url; }
};


#endif
