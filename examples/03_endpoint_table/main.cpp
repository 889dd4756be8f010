// Example 03: Endpoint Table
//
// Loads per-endpoint policy from a JSON file and enables response caching.
//
// Usage: endpoint_table <config.json> [base-url]

#include <sturdy/cache/cache_backend.hpp>
#include <sturdy/client/client.hpp>
#include <sturdy/interceptors/cache_interceptor.hpp>
#include <sturdy/interceptors/resilience_interceptors.hpp>
#include <sturdy/log/spdlog_logger.hpp>
#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <string>

using namespace sturdy;

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <config.json> [base-url]\n";
        return 1;
    }

    set_logger(make_spdlog_console_logger(LogLevel::Debug));

    std::ifstream file(argv[1]);
    if (!file) {
        std::cerr << "Cannot open " << argv[1] << "\n";
        return 1;
    }
    const auto config = nlohmann::json::parse(file, nullptr, false);
    if (config.is_discarded()) {
        std::cerr << argv[1] << " is not valid JSON\n";
        return 1;
    }

    auto table = EndpointTable::from_json(config);
    if (!table) {
        std::cerr << "Invalid endpoint config: " << table.error().message << "\n";
        return 1;
    }
    std::cout << "Loaded " << table->size() << " endpoint routes\n";

    auto cache = std::make_shared<MemoryCacheBackend>();
    auto options = ClientOptions{}
        .with_base_url((argc > 2) ? argv[2] : "https://httpbin.org")
        .with_endpoint_table(*table)
        .with_interceptors({
            cache_interceptor(CacheConfig{.cache = cache}),
            rate_limit_interceptor(),
            circuit_breaker_interceptor()
        });

    Client client(std::move(options));

    // A cacheable route answers the second call from memory
    for (int i = 0; i < 2; ++i) {
        auto result = client.get("/cache/60");
        if (result) {
            std::cout << "GET /cache/60 -> " << result->status_code << "\n";
        } else {
            std::cerr << "GET /cache/60 failed: " << result.error().message() << "\n";
        }
    }
    std::cout << "Cached entries: " << cache->size() << "\n";

    client.shutdown();
    return 0;
}
