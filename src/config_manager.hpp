#ifndef CONFIG_MANAGER_HPP
#define CONFIG_MANAGER_HPP


#include <exception>
#include <fstream>
#include <locale>
#include <map>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>




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
        _prop = std::stoi(value, &end, base);
        if (end != value.size()) throw std::invalid_argument("trailing characters in '" + value + "'");
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
    static std::map<int, void (ConfigManager::*)(std::istream &)> _parsers;

private:
    std::string _path;

    std::map<std::string, std::unique_ptr<Property>> _properties;

    void insertDefaults();
    void parse(std::istream & configFile);
    void parse_v1(std::istream & configFile);

public:
    template<typename... T,
             typename = std::enable_if_t<(std::is_convertible_v<T const &, std::string> && ...)>>
    ConfigManager(T const & ... paths);
    // Parses already-opened contents; `name` is only used in error messages
    ConfigManager(std::istream & contents, std::string const & name);

    std::string const & path() const { return _path; }

    int const & getInt(std::string const & key) const;
    std::string const & getStr(std::string const & key) const;
};


template<typename... T, typename>
ConfigManager::ConfigManager(T const & ... paths) {
    insertDefaults();

    // Try opening all INI files, grabbing the first matching one (the most specific)
    std::ifstream configFile;

    for (std::string const & path : { std::string(paths)... }) {
        configFile = std::ifstream(path);

        if (!configFile.fail()) {
            _path = path;
            goto found; // C++ does not have `for {} else {}`, sadly...
        }

        spdlog::get("logger")->warn("Failed to open ini file {}, falling back...", path);
    }
    throw std::runtime_error("Failed to open any ini file");

found:
    spdlog::get("logger")->info("Reading configuration from {}", _path);
    parse(configFile);
}


#endif
