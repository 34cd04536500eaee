#include <algorithm>
#include <cctype>
#include <iostream>
#include <limits>

#include "config_manager.hpp"


ConfigManager::ConfigManager(std::istream & contents, std::string const & name)
 : _path(name) {
    insertDefaults();
    parse(contents);
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


void ConfigManager::insertDefaults() {
    // Can't do this from std::map init because it insists on using a copy constructor
    _properties.emplace("port",                  std::make_unique<IntProperty<10>>(8080));
    _properties.emplace("local_device_id",       std::make_unique<StringProperty>("local"));
    _properties.emplace("local_device_name",     std::make_unique<StringProperty>("Player"));
    _properties.emplace("session_file",          std::make_unique<StringProperty>("sessions.json"));
    _properties.emplace("liveness_timeout_ms",   std::make_unique<IntProperty<10>>(15000));
    _properties.emplace("keepalive_interval_ms", std::make_unique<IntProperty<10>>(15000));
    _properties.emplace("sweep_interval_ms",     std::make_unique<IntProperty<10>>(1000));
    _properties.emplace("pairing_timeout_s",     std::make_unique<IntProperty<10>>(300));
    _properties.emplace("session_lifetime_days", std::make_unique<IntProperty<10>>(30));
    _properties.emplace("report_interval_ms",    std::make_unique<IntProperty<10>>(200));
    _properties.emplace("log_level",             std::make_unique<StringProperty>("info"));
}


std::map<int, void (ConfigManager::*)(std::istream &)> ConfigManager::_parsers{
    {1, &ConfigManager::parse_v1}
};

void ConfigManager::parse(std::istream & configFile) {
    // We want a unique locale for parsing option files, nothing system-dependent
    configFile.imbue(std::locale::classic());

    // First, expect a version line
    unsigned version;
    if ([&configFile, &version]() {
        if (configFile.get() != '#') return true;
        std::string s;
        configFile >> s;
        if (s != "version") return true;
        configFile >> version;
        return configFile.fail();
    }()) {
        throw std::runtime_error(_path + ": Expected a version line on line 1");
    }
    configFile.ignore(std::numeric_limits<std::streamsize>::max(), '\n');

    // Now, parse config lines
    try {
        (this->*_parsers.at(version))(configFile);
    } catch (std::out_of_range const &) {
        throw std::out_of_range(_path + ": Unsupported version " + std::to_string(version));
    }
}


static std::string_view trim(std::string_view str) {
    auto isSpace = [](char c){ return std::isspace(static_cast<unsigned char>(c)); };
    while (!str.empty() && isSpace(str.front())) str.remove_prefix(1);
    while (!str.empty() && isSpace(str.back())) str.remove_suffix(1);
    return str;
}

void ConfigManager::parse_v1(std::istream & configFile) {
    std::string line;
    // Line 1 was the version line
    for (unsigned lineNo = 2; std::getline(configFile, line); ++lineNo) {
        std::string_view content = trim(line);
        if (content.empty() || content.front() == ';') continue; // Skip blank and comment lines

        auto equals = content.find('=');
        if (equals == content.npos) {
            throw std::runtime_error(_path + ":" + std::to_string(lineNo) + ": Found property name '"
                                      + std::string(content) + "' but no value");
        }
        std::string propName(trim(content.substr(0, equals)));
        std::string value(trim(content.substr(equals + 1)));

        auto property = _properties.find(propName);
        if (property == _properties.end()) {
            throw std::runtime_error(_path + ":" + std::to_string(lineNo) + ": Unknown property '"
                                      + propName + "'");
        }
        try {
            property->second->set(value);
        } catch (std::logic_error const & e) { // `stoi`'s invalid_argument and out_of_range
            throw std::runtime_error(_path + ":" + std::to_string(lineNo) + ": Bad value for '"
                                      + propName + "': " + e.what());
        }
    }
}
