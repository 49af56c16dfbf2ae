
#include <curl/curl.h>

#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>

#include "comet_error.hpp"
#include "curl_transport.hpp"


CurlGlobal::CurlGlobal() {
    CURLcode result = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (result != CURLE_OK) {
        throw std::runtime_error(std::string("Failed to initialize libcurl: ") + curl_easy_strerror(result));
    }
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}


char const * const CurlTransport::userAgent = "maruska/" MARUSKA_VERSION;

static size_t writeCallback(char * ptr, size_t size, size_t nmemb, void * userdata) {
    size_t total = size * nmemb;
    reinterpret_cast<std::string *>(userdata)->append(ptr, total);
    return total;
}

// Returning non-zero makes libcurl abort the transfer with `CURLE_ABORTED_BY_CALLBACK`
static int progressCallback(void * userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return reinterpret_cast<CurlTransport const *>(userdata)->cancelled() ? 1 : 0;
}


CurlTransport::CurlTransport(std::string const & url, std::chrono::seconds connectTimeout,
                             std::chrono::seconds requestTimeout)
 : _url(url), _connectTimeout(connectTimeout), _requestTimeout(requestTimeout), _cancelled(false) {}

std::string CurlTransport::post(std::string const & body) {
    if (_cancelled) throw TransportError("transport was cancelled");

    // Easy handles can't be shared between threads, and each worker posts on its own
    std::unique_ptr<CURL, void (*)(CURL *)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) throw TransportError("curl_easy_init() failed");

    std::unique_ptr<curl_slist, void (*)(curl_slist *)> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"), curl_slist_free_all);

    std::string response;
    char errorBuffer[CURL_ERROR_SIZE] = "";

    curl_easy_setopt(curl.get(), CURLOPT_URL, _url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, userAgent);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L); // We're multithreaded
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(_connectTimeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(_requestTimeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, this);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);

    CURLcode result = curl_easy_perform(curl.get());
    if (result != CURLE_OK) {
        throw TransportError("POST " + _url + " failed: "
                             + (errorBuffer[0] ? errorBuffer : curl_easy_strerror(result)));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        throw TransportError("POST " + _url + " was rejected", status);
    }

    spdlog::get("logger")->trace("POST {} -> {} ({} bytes)", _url, status, response.size());
    return response;
}
