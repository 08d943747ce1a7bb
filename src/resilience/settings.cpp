#include <tripwire/resilience/settings.h>

#include <tripwire/config/config.h>

#include <string_view>

namespace tripwire::resilience {
namespace {

// Missing keys leave `out` untouched.
tripwire::Status ReadCount(const tripwire::config::Config& cfg, std::string_view key, std::uint64_t& out) {
    if (!cfg.Has(key)) {
        return tripwire::Status::Ok();
    }
    auto v = cfg.GetInt(key);
    if (!v.ok()) {
        return v.status();
    }
    if (v.value() < 0) {
        return tripwire::Status(tripwire::StatusCode::invalid_argument, std::string(key) + " must be >= 0");
    }
    out = static_cast<std::uint64_t>(v.value());
    return tripwire::Status::Ok();
}

tripwire::Status ReadMillis(const tripwire::config::Config& cfg, std::string_view key, std::chrono::milliseconds& out) {
    std::uint64_t ms = static_cast<std::uint64_t>(out.count());
    auto st = ReadCount(cfg, key, ms);
    if (st.ok()) {
        out = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(ms));
    }
    return st;
}

} // namespace

Settings DefaultSettings() {
    return Settings{};
}

Settings Normalize(Settings settings) {
    if (settings.name.empty()) {
        settings.name = "default";
    }
    if (settings.success_threshold == 0) {
        settings.success_threshold = 1;
    }
    if (settings.window_buckets <= 0) {
        settings.window_buckets = 10;
    }
    return settings;
}

tripwire::Result<Settings> SettingsFromConfig(const tripwire::config::Config& cfg) {
    Settings s = DefaultSettings();

    if (cfg.Has("name")) {
        auto v = cfg.GetString("name");
        if (!v.ok()) {
            return v.status();
        }
        s.name = std::move(v).value();
    }

    std::string kind = "consecutive_failures";
    if (cfg.Has("threshold")) {
        auto v = cfg.GetString("threshold");
        if (!v.ok()) {
            return v.status();
        }
        kind = v.value();
    }

    if (kind == "consecutive_failures") {
        std::uint64_t n = 5;
        if (auto st = ReadCount(cfg, "consecutive_failures", n); !st.ok()) {
            return st;
        }
        s.failure_threshold = ThresholdPolicy::ConsecutiveFailures(n);
    } else if (kind == "failure_rate") {
        double rate = 0.5;
        std::uint64_t samples = 10;
        if (cfg.Has("failure_rate")) {
            auto v = cfg.GetDouble("failure_rate");
            if (!v.ok()) {
                return v.status();
            }
            rate = v.value();
        }
        if (rate < 0.0 || rate > 1.0) {
            return tripwire::Status(tripwire::StatusCode::invalid_argument, "failure_rate must be within [0,1]");
        }
        if (auto st = ReadCount(cfg, "min_samples", samples); !st.ok()) {
            return st;
        }
        s.failure_threshold = ThresholdPolicy::FailureRate(rate, samples);
    } else {
        return tripwire::Status(tripwire::StatusCode::invalid_argument, "unknown threshold: " + kind);
    }

    if (auto st = ReadCount(cfg, "success_threshold", s.success_threshold); !st.ok()) {
        return st;
    }
    if (auto st = ReadCount(cfg, "minimum_request_volume", s.minimum_request_volume); !st.ok()) {
        return st;
    }
    if (auto st = ReadMillis(cfg, "timeout_ms", s.timeout); !st.ok()) {
        return st;
    }
    if (auto st = ReadMillis(cfg, "rolling_window_ms", s.rolling_window); !st.ok()) {
        return st;
    }
    if (auto st = ReadMillis(cfg, "reset_timeout_ms", s.reset_timeout); !st.ok()) {
        return st;
    }
    if (cfg.Has("window_buckets")) {
        auto v = cfg.GetInt("window_buckets");
        if (!v.ok()) {
            return v.status();
        }
        s.window_buckets = v.value();
    }

    return Normalize(std::move(s));
}

} // namespace tripwire::resilience
