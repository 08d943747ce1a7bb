#pragma once

#include <string>
#include <string_view>

#include <tripwire/core/status.h>

#include <chjson/chjson.hpp>

namespace tripwire::config {

// Flat JSON object of settings.
class Config {
public:
    static tripwire::Result<Config> LoadFile(std::string path);
    static tripwire::Result<Config> LoadString(std::string_view text);

    bool Has(std::string_view key) const;

    tripwire::Result<std::string> GetString(std::string_view key) const;
    tripwire::Result<int> GetInt(std::string_view key) const;
    tripwire::Result<double> GetDouble(std::string_view key) const;

    const chjson::sv_value& raw() const { return doc_.root(); }

private:
    chjson::document doc_;
};

} // namespace tripwire::config
