
#include <algorithm>
#include <cmath>

#include "media.hpp"


// Seconds from the server, in nanoseconds
// Non-finite values are zero, values beyond about 285 years saturate
static std::chrono::nanoseconds toNanoseconds(double seconds) {
    static double const limit = 9e18;

    if (!std::isfinite(seconds)) return std::chrono::nanoseconds::zero();
    double const nanoseconds = seconds * 1e9;
    if (nanoseconds >= limit) return std::chrono::nanoseconds::max();
    if (nanoseconds <= -limit) return std::chrono::nanoseconds::min();
    return std::chrono::nanoseconds(static_cast<std::chrono::nanoseconds::rep>(nanoseconds));
}


Media::Media(std::string const & key, std::string const & artist, std::string const & title,
             std::chrono::nanoseconds length, std::string const & uploadedByKey)
 : _key(key), _artist(artist), _title(title), _length(length), _uploadedByKey(uploadedByKey) {}

bool Media::operator==(Media const & media) const {
    return _key == media._key && _artist == media._artist && _title == media._title
        && _length == media._length && _uploadedByKey == media._uploadedByKey;
}


Playing::Playing(std::optional<std::string> const & byKey, double endTime, Media const & media,
                 double serverTime)
 : _byKey(byKey), _endTime(std::isfinite(endTime) ? endTime : 0),
   _media(media), _serverTime(std::isfinite(serverTime) ? serverTime : 0) {}

static double toSeconds(std::chrono::system_clock::time_point time) {
    return std::chrono::duration<double>(time.time_since_epoch()).count();
}

double Playing::correctedEndSeconds(std::chrono::system_clock::time_point localNow) const {
    return _endTime + (toSeconds(localNow) - _serverTime);
}

std::chrono::system_clock::time_point Playing::correctedEndTime(std::chrono::system_clock::time_point localNow) const {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(toNanoseconds(correctedEndSeconds(localNow))));
}

std::chrono::nanoseconds Playing::remaining(std::chrono::system_clock::time_point receivedAt,
                                            std::chrono::system_clock::time_point localNow) const {
    // Subtracted as seconds, the end time may be anywhere
    return std::max(std::chrono::nanoseconds::zero(),
                    toNanoseconds(correctedEndSeconds(receivedAt) - toSeconds(localNow)));
}

bool Playing::operator==(Playing const & playing) const {
    return _byKey == playing._byKey && _endTime == playing._endTime && _media == playing._media
        && _serverTime == playing._serverTime;
}


Request::Request(std::optional<std::string> const & byKey, int64_t key, Media const & media)
 : _byKey(byKey), _key(key), _media(media) {}

bool Request::operator==(Request const & request) const {
    return _byKey == request._byKey && _key == request._key && _media == request._media;
}


// `null` and a missing key both mean "nobody"
static std::optional<std::string> optionalKey(nlohmann::json const & json, char const * name) {
    auto iter = json.find(name);
    if (iter == json.end() || iter->is_null()) return std::nullopt;
    return iter->get<std::string>();
}

void from_json(nlohmann::json const & json, Media & media) {
    // Lengths may be fractional; anything below a nanosecond is dropped
    media = Media(json.at("key").get<std::string>(),
                  json.at("artist").get<std::string>(),
                  json.at("title").get<std::string>(),
                  toNanoseconds(json.at("length").get<double>()),
                  json.at("uploadedByKey").get<std::string>());
}

void from_json(nlohmann::json const & json, Playing & playing) {
    playing = Playing(optionalKey(json, "byKey"),
                      json.at("endTime").get<double>(),
                      json.at("media").get<Media>(),
                      json.at("serverTime").get<double>());
}

void from_json(nlohmann::json const & json, Request & request) {
    request = Request(optionalKey(json, "byKey"),
                      json.at("key").get<int64_t>(),
                      json.at("media").get<Media>());
}
