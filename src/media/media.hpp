#ifndef MEDIA_HPP
#define MEDIA_HPP

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>


class Media {
private:
    std::string _key;
    std::string _artist;
    std::string _title;
    std::chrono::nanoseconds _length;
    std::string _uploadedByKey;

public:
    Media() : _length(0) {}
    Media(std::string const & key, std::string const & artist, std::string const & title,
          std::chrono::nanoseconds length, std::string const & uploadedByKey);

    std::string const & key() const { return _key; }
    std::string const & artist() const { return _artist; }
    std::string const & title() const { return _title; }
    std::chrono::nanoseconds length() const { return _length; }
    std::string const & uploadedByKey() const { return _uploadedByKey; }

    bool operator==(Media const & media) const;
    bool operator!=(Media const & media) const { return !(*this == media); }
};


// What the server is currently playing
// Times are Unix timestamps in seconds, as seen by the server's clock
class Playing {
private:
    std::optional<std::string> _byKey; // Empty if the server picked the song
    double _endTime;
    Media _media;
    double _serverTime;

public:
    Playing() : _endTime(0), _serverTime(0) {}
    Playing(std::optional<std::string> const & byKey, double endTime, Media const & media,
            double serverTime);

    std::optional<std::string> const & byKey() const { return _byKey; }
    double endTime() const { return _endTime; }
    Media const & media() const { return _media; }
    double serverTime() const { return _serverTime; }

    // `endTime` shifted by the skew between the server's clock and ours, `localNow` being when
    // `serverTime` was sent
    std::chrono::system_clock::time_point correctedEndTime(std::chrono::system_clock::time_point localNow) const;
    // Never negative
    std::chrono::nanoseconds remaining(std::chrono::system_clock::time_point receivedAt,
                                       std::chrono::system_clock::time_point localNow) const;

    bool operator==(Playing const & playing) const;

private:
    double correctedEndSeconds(std::chrono::system_clock::time_point localNow) const;
};


class Request {
private:
    std::optional<std::string> _byKey;
    int64_t _key;
    Media _media;

public:
    Request() : _key(0) {}
    Request(std::optional<std::string> const & byKey, int64_t key, Media const & media);

    std::optional<std::string> const & byKey() const { return _byKey; }
    int64_t key() const { return _key; }
    Media const & media() const { return _media; }

    bool operator==(Request const & request) const;
};


// Picked up by nlohmann::json's `get<T>()`; throw `nlohmann::json::exception` on bad input
void from_json(nlohmann::json const & json, Media & media);
void from_json(nlohmann::json const & json, Playing & playing);
void from_json(nlohmann::json const & json, Request & request);


#endif
