#include <tripwire/config/config.h>
#include <tripwire/core/log.h>
#include <tripwire/resilience/breaker_logging.h>
#include <tripwire/resilience/circuit_breaker.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <random>
#include <string>
#include <string_view>
#include <thread>

namespace {

// Pretends to be a remote dependency that fails a share of its calls and
// can be switched fully down.
class FlakyService {
public:
    explicit FlakyService(double failure_ratio) : failure_ratio_(failure_ratio), gen_(std::random_device{}()) {}

    void SetDown(bool down) { down_.store(down, std::memory_order_relaxed); }

    tripwire::Result<std::string> Call(const tripwire::Context& ctx) {
        // Simulated latency; gives up early when the caller does.
        if (!ctx.WaitFor(std::chrono::milliseconds(5))) {
            return ctx.Err();
        }
        if (down_.load(std::memory_order_relaxed) || dist_(gen_) < failure_ratio_) {
            return tripwire::Status(tripwire::StatusCode::unavailable, "service unavailable");
        }
        return std::string("pong");
    }

private:
    double failure_ratio_;
    std::atomic<bool> down_{false};
    std::mt19937 gen_;
    std::uniform_real_distribution<double> dist_{0.0, 1.0};
};

} // namespace

int main(int argc, char** argv) {
    std::string log_level = "debug";
    std::string config_path;
    int calls = 60;
    double failure_ratio = 0.1;

    for (int i = 1; i < argc; ++i) {
        std::string_view a(argv[i]);
        if (a == "--log" && i + 1 < argc) {
            log_level = argv[++i];
        } else if (a == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (a == "--calls" && i + 1 < argc) {
            calls = std::atoi(argv[++i]);
        } else if (a == "--failure-ratio" && i + 1 < argc) {
            failure_ratio = std::atof(argv[++i]);
        }
    }

    tripwire::log::Init(log_level);

    auto settings = tripwire::resilience::DefaultSettings();
    settings.name = "example-service";
    settings.failure_threshold = tripwire::resilience::ThresholdPolicy::ConsecutiveFailures(3);
    settings.timeout = std::chrono::milliseconds(500);
    settings.success_threshold = 2;

    if (!config_path.empty()) {
        auto cfg = tripwire::config::Config::LoadFile(config_path);
        if (!cfg.ok()) {
            std::cerr << "Failed to load config: " << cfg.status().ToString() << "\n";
            return 2;
        }
        auto loaded = tripwire::resilience::SettingsFromConfig(cfg.value());
        if (!loaded.ok()) {
            std::cerr << "Invalid config: " << loaded.status().ToString() << "\n";
            return 2;
        }
        settings = std::move(loaded).value();
    }

    auto breaker = tripwire::resilience::CircuitBreaker::Create(settings);
    tripwire::resilience::AttachLogging(*breaker);

    FlakyService service(failure_ratio);

    for (int i = 0; i < calls; ++i) {
        // Knock the service over for a while in the middle of the run.
        if (i == calls / 4) {
            tripwire::log::info("service goes down");
            service.SetDown(true);
        } else if (i == calls / 2) {
            tripwire::log::info("service comes back");
            service.SetDown(false);
        }

        auto ctx = tripwire::Context::WithTimeout(std::chrono::milliseconds(100));
        auto result = breaker->ExecuteWithFallbackContext(
            ctx,
            [&](const tripwire::Context& c) { return service.Call(c); },
            [](const tripwire::Context&, const tripwire::Status& err) -> tripwire::Result<std::string> {
                if (tripwire::resilience::IsCircuitOpen(err)) {
                    return std::string("cached-pong");
                }
                return err;
            });

        if (result.ok()) {
            tripwire::log::info("call {} -> {}", i, result.value());
        } else {
            tripwire::log::info("call {} -> {}", i, result.status().ToString());
        }

        tripwire::resilience::LogMetrics(breaker->GetMetrics());
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    auto m = breaker->GetMetrics();
    tripwire::log::info("final state={} requests={} failures={}",
                        tripwire::resilience::ToString(m.state), m.total_requests, m.total_failures);
    breaker->Shutdown();
    return 0;
}
