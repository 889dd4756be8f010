#include "sturdy/interceptors/observability_interceptors.hpp"

#include "sturdy/log/logger.hpp"

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <prometheus/text_serializer.h>

#include <chrono>
#include <map>
#include <mutex>
#include <sstream>
#include <utility>

namespace sturdy {

namespace {

// Go client default buckets, in seconds
const prometheus::Histogram::BucketBoundaries kDurationBuckets{
    0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0
};

struct MetricFamilies {
    prometheus::Family<prometheus::Histogram>* request_duration{nullptr};
    prometheus::Family<prometheus::Counter>* requests_total{nullptr};
    prometheus::Family<prometheus::Counter>* request_errors{nullptr};
};

std::string metric_prefix(const MetricsConfig& config) {
    std::string prefix = config.ns.empty() ? std::string("http_client") : config.ns;
    prefix += '_';
    if (config.subsystem.empty() == false) {
        prefix += config.subsystem;
        prefix += '_';
    }
    return prefix;
}

// Printable ASCII only, so the text exposition stays valid
std::string sanitize_label_value(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char ch : value) {
        out.push_back((ch >= 0x20 && ch <= 0x7E) ? static_cast<char>(ch) : '_');
    }
    return out;
}

// Families are cached per (registry, prefix); registering twice reuses them.
// The weak reference detects a registry that died and whose address was reused.
MetricFamilies get_or_register(const std::shared_ptr<prometheus::Registry>& registry, const std::string& prefix) {
    struct CachedFamilies {
        std::weak_ptr<prometheus::Registry> owner;
        MetricFamilies families;
    };
    static std::mutex mutex;
    static std::map<std::pair<const prometheus::Registry*, std::string>, CachedFamilies> cache;

    std::lock_guard<std::mutex> lock(mutex);
    const auto key = std::make_pair(static_cast<const prometheus::Registry*>(registry.get()), prefix);
    const auto it = cache.find(key);
    if (it != cache.end()) {
        if (it->second.owner.lock() == registry) {
            return it->second.families;
        }
        cache.erase(it);
    }

    MetricFamilies created;
    created.request_duration = &prometheus::BuildHistogram()
        .Name(prefix + "request_duration_seconds")
        .Help("Time spent processing HTTP requests")
        .Register(*registry);
    created.requests_total = &prometheus::BuildCounter()
        .Name(prefix + "requests_total")
        .Help("Total number of HTTP requests")
        .Register(*registry);
    created.request_errors = &prometheus::BuildCounter()
        .Name(prefix + "request_errors_total")
        .Help("Total number of HTTP request errors")
        .Register(*registry);

    cache.emplace(key, CachedFamilies{registry, created});
    get_logger().debug("registered http client metrics", {{"prefix", prefix}});
    return created;
}

}  // namespace

std::shared_ptr<prometheus::Registry> default_metrics_registry() {
    static const auto registry = std::make_shared<prometheus::Registry>();
    return registry;
}

std::string serialize_metrics(const prometheus::Registry& registry) {
    std::ostringstream output;
    prometheus::TextSerializer serializer;
    serializer.Serialize(output, registry.Collect());
    return output.str();
}

Interceptor metrics_interceptor(MetricsConfig config) {
    if (config.registry == nullptr) {
        config.registry = default_metrics_registry();
    }
    const MetricFamilies families = get_or_register(config.registry, metric_prefix(config));

    // The registry owns the families; keep it alive as long as the chain
    auto registry = config.registry;

    return [families, registry](TransportPtr next) {
        return make_transport([next, families, registry](HttpRequest& request, const RequestContext& ctx) {
            const auto start = std::chrono::steady_clock::now();
            auto outcome = next->send(request, ctx);
            const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

            const std::string method = to_string(request.method);
            const std::string host = sanitize_label_value(ctx.target.authority());
            const std::string path = sanitize_label_value(ctx.target.path);

            if (outcome.has_value() == false) {
                families.request_errors->Add({
                    {"method", method},
                    {"host", host},
                    {"path", path},
                    {"error", std::string(to_string(outcome.error().code))}
                }).Increment();
                return outcome;
            }

            const prometheus::Labels labels{
                {"method", method},
                {"host", host},
                {"path", path},
                {"status", std::to_string(outcome->status_code)}
            };
            families.request_duration->Add(labels, kDurationBuckets).Observe(elapsed.count());
            families.requests_total->Add(labels).Increment();
            return outcome;
        });
    };
}

}  // namespace sturdy
