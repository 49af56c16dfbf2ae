
#include <cstdlib>
#include <fstream>
#include <locale>
#include <spdlog/spdlog.h>
#include <sstream>
#include <string_view>

#include "config_manager.hpp"


ConfigManager::ConfigManager() {
    // Insert default values
    // Can't do this from std::map init because it insists on using a copy constructor
    _properties.emplace("host",               std::make_unique<StringProperty>("http://marietje-noord.marie-curie.nl/api"));
    _properties.emplace("log_level",          std::make_unique<StringProperty>("info"));
    _properties.emplace("log_file",           std::make_unique<StringProperty>(""));
    _properties.emplace("username",           std::make_unique<StringProperty>(""));
    _properties.emplace("access_key",         std::make_unique<StringProperty>(""));
    _properties.emplace("password",           std::make_unique<StringProperty>(""));
    _properties.emplace("connect_timeout",    std::make_unique<IntProperty<10>>(10));
    _properties.emplace("request_timeout",    std::make_unique<IntProperty<10>>(0));
    _properties.emplace("retry_delay_ms",     std::make_unique<IntProperty<10>>(500));
    _properties.emplace("retry_max_delay_ms", std::make_unique<IntProperty<10>>(30000));
    _properties.emplace("search_count",       std::make_unique<IntProperty<10>>(100));
}

ConfigManager::ConfigManager(std::vector<std::string> const & paths) : ConfigManager() {
    // Try opening all INI files, grabbing the first matching one (the most specific)
    for (std::string const & path : paths) {
        std::ifstream configFile(path);
        if (!configFile.fail()) {
            parse(configFile, path);
            return;
        }
        spdlog::get("logger")->debug("Failed to open ini file {}, falling back...", path);
    }
    spdlog::get("logger")->warn("Found no ini file, using default configuration");
}

std::vector<std::string> ConfigManager::defaultPaths() {
    std::vector<std::string> paths{"maruska.ini"};
    if (char const * home = std::getenv("HOME")) {
        paths.push_back(std::string(home) + "/.config/maruska.ini");
    }
    paths.push_back("/etc/maruska.ini");
    return paths;
}


int const & ConfigManager::getInt(std::string const & key) const {
    try {
        return _properties.at(key)->getInt();
    } catch (Property::InvalidType const &) {
        throw std::runtime_error("Property \"" + key + "\" cannot be retrieved as int");
    }
}
std::string const & ConfigManager::getStr(std::string const & key) const {
    try {
        return _properties.at(key)->getStr();
    } catch (Property::InvalidType const &) {
        throw std::runtime_error("Property \"" + key + "\" cannot be retrieved as string");
    }
}

void ConfigManager::set(std::string const & key, std::string const & value) {
    auto property = _properties.find(key);
    if (property == _properties.end()) {
        throw std::runtime_error("Unknown property '" + key + "'");
    }
    try {
        property->second->set(value);
    } catch (std::logic_error const &) { // What `std::stoi` throws
        throw std::runtime_error("Invalid value '" + value + "' for property '" + key + "'");
    }
}


// We want a unique locale for parsing option files, nothing system-dependent
static std::string_view trim(std::string_view str) {
    std::locale const & locale = std::locale::classic();
    while (!str.empty() && std::isspace(str.front(), locale)) str.remove_prefix(1);
    while (!str.empty() && std::isspace(str.back(), locale)) str.remove_suffix(1);
    return str;
}

void ConfigManager::parse(std::istream & configFile, std::string const & path) {
    _path = path;
    configFile.imbue(std::locale::classic());

    // First, expect a version line
    std::string line;
    unsigned version;
    if ([&configFile, &line, &version]() {
        if (!std::getline(configFile, line)) return true;
        std::istringstream versionLine(line);
        versionLine.imbue(std::locale::classic());
        if (versionLine.get() != '#') return true;
        std::string s;
        versionLine >> s;
        if (s != "version") return true;
        versionLine >> version;
        return versionLine.fail();
    }()) {
        throw std::runtime_error(_path + ": Expected a version line on line 1");
    }

    // Now, parse config lines
    auto parser = _parsers.find(version);
    if (parser == _parsers.end()) {
        throw std::out_of_range(_path + ": Unsupported version " + std::to_string(version));
    }
    (this->*parser->second)(configFile);
}


std::map<unsigned, void (ConfigManager::*)(std::istream &)> ConfigManager::_parsers{
    {1, &ConfigManager::parse_v1}
};

void ConfigManager::parse_v1(std::istream & configFile) {
    std::string line;
    unsigned lineNo = 1;
    while (std::getline(configFile, line)) {
        ++lineNo;
        std::string_view content = trim(line);
        if (content.empty() || content.front() == ';') continue; // Skip blank and comment lines

        auto equals = content.find('=');
        if (equals == content.npos) {
            throw std::runtime_error(_path + ":" + std::to_string(lineNo) + ": Found property name '"
                                     + std::string(content) + "' but no value");
        }
        // Empty values are fine, they reset a property
        std::string const name(trim(content.substr(0, equals)));
        std::string const value(trim(content.substr(equals + 1)));

        try {
            set(name, value);
        } catch (std::runtime_error const & e) {
            throw std::runtime_error(_path + ":" + std::to_string(lineNo) + ": " + e.what());
        }
    }
}
