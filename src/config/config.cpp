#include <tripwire/config/config.h>

#include <fstream>
#include <sstream>
#include <string>

namespace tripwire::config {

namespace {

// Reports where parsing stopped.
std::string FormatParseError(const chjson::error& e) {
    std::ostringstream oss;
    oss << "invalid json at line " << e.line << ", col " << e.column
        << " (error " << static_cast<int>(e.code) << ")";
    return oss.str();
}

} // namespace

tripwire::Result<Config> Config::LoadFile(std::string path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return tripwire::Status(tripwire::StatusCode::not_found, "config file not found: " + path);
    }

    std::ostringstream ss;
    ss << ifs.rdbuf();
    return LoadString(ss.str());
}

tripwire::Result<Config> Config::LoadString(std::string_view text) {
    auto r = chjson::parse(text);
    if (r.err) {
        return tripwire::Status(tripwire::StatusCode::invalid_argument, FormatParseError(r.err));
    }

    if (!r.doc.root().is_object()) {
        return tripwire::Status(tripwire::StatusCode::invalid_argument, "config root must be a JSON object");
    }

    Config c;
    c.doc_ = std::move(r.doc);
    return c;
}

bool Config::Has(std::string_view key) const {
    return doc_.root().find(key) != nullptr;
}

tripwire::Result<std::string> Config::GetString(std::string_view key) const {
    const auto* v = doc_.root().find(key);
    if (v == nullptr) {
        return tripwire::Status(tripwire::StatusCode::not_found, "missing key: " + std::string(key));
    }
    if (!v->is_string()) {
        return tripwire::Status(tripwire::StatusCode::invalid_argument, std::string(key) + " is not a string");
    }
    return std::string(v->as_string_view());
}

tripwire::Result<int> Config::GetInt(std::string_view key) const {
    const auto* v = doc_.root().find(key);
    if (v == nullptr) {
        return tripwire::Status(tripwire::StatusCode::not_found, "missing key: " + std::string(key));
    }
    if (!v->is_number() || !v->is_int()) {
        return tripwire::Status(tripwire::StatusCode::invalid_argument, std::string(key) + " is not an int");
    }
    return static_cast<int>(v->as_int());
}

tripwire::Result<double> Config::GetDouble(std::string_view key) const {
    const auto* v = doc_.root().find(key);
    if (v == nullptr) {
        return tripwire::Status(tripwire::StatusCode::not_found, "missing key: " + std::string(key));
    }
    if (!v->is_number()) {
        return tripwire::Status(tripwire::StatusCode::invalid_argument, std::string(key) + " is not a number");
    }
    if (v->is_int()) {
        return static_cast<double>(v->as_int());
    }
    return v->as_double();
}

} // namespace tripwire::config
