#ifndef CONFIG_MANAGER_HPP
#define CONFIG_MANAGER_HPP


#include <istream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>




class Property {
public:
    class InvalidType : public std::runtime_error {
    public:
        InvalidType() : std::runtime_error("Property isn't of specified type") {}
    };

    virtual ~Property() = default;

    virtual int const & getInt() const { throw InvalidType(); };
    virtual std::string const & getStr() const { throw InvalidType(); };

    virtual void set(std::string const & value) = 0;
};

template<int base>
class IntProperty : public Property {
    int _prop;
public:
    IntProperty(int const & value) : _prop(value) {}
    int const & getInt() const { return _prop; }
    void set(std::string const & value) {
        std::size_t end;
        int prop = std::stoi(value, &end, base);
        if (end != value.size()) throw std::invalid_argument("trailing characters after number");
        _prop = prop;
    }
};

class StringProperty : public Property {
    std::string _prop;
public:
    StringProperty(std::string const & value) : _prop(value) {}
    std::string const & getStr() const { return _prop; }
    void set(std::string const & value) { _prop = value; }
};


class ConfigManager {
private:
    static std::map<unsigned, void (ConfigManager::*)(std::istream &)> _parsers;

private:
    std::string _path; // Empty if running on defaults

    std::map<std::string, std::unique_ptr<Property>> _properties;

    void parse_v1(std::istream & configFile);

public:
    static std::vector<std::string> defaultPaths();

    ConfigManager(); // Defaults only
    // Reads the first of `paths` that can be opened, most specific first
    ConfigManager(std::vector<std::string> const & paths);

    // Throws `std::runtime_error` naming `path` if the contents are invalid
    void parse(std::istream & configFile, std::string const & path);

    std::string const & path() const { return _path; }
    int const & getInt(std::string const & key) const;
    std::string const & getStr(std::string const & key) const;
    void set(std::string const & key, std::string const & value);
};


#endif
