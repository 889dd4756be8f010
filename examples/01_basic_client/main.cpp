// Example 01: Basic Client
//
// Plain GET and POST calls with the default policy (10s timeout, 2 retries).
//
// Usage: basic_client [base-url]

#include <sturdy/client/client.hpp>
#include <sturdy/interceptors/header_interceptors.hpp>
#include <sturdy/log/spdlog_logger.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

using namespace sturdy;
using Json = nlohmann::json;

int main(int argc, char* argv[]) {
    std::cout << "=== Basic Client Example ===\n\n";

    set_logger(make_spdlog_console_logger(LogLevel::Debug));

    const std::string base_url = (argc > 1) ? argv[1] : "https://httpbin.org";

    // 1. Configure the client
    auto options = ClientOptions{}
        .with_base_url(base_url)
        .with_default_settings(EndpointSettings{}
            .with_header("Accept", "application/json")
            .with_header("User-Agent", "sturdy-example/1.0"))
        .with_interceptor(request_id_interceptor());

    Client client(std::move(options));

    // 2. GET
    std::cout << "GET /get\n";
    auto got = client.get("/get?example=basic");
    if (!got) {
        std::cerr << "  failed: " << got.error().message() << "\n";
        return 1;
    }
    std::cout << "  status: " << got->status_code << "\n";

    const auto echoed = Json::parse(got->text(), nullptr, false);
    if (echoed.is_discarded() == false && echoed.contains("headers")) {
        std::cout << "  request id seen by server: "
                  << echoed["headers"].value("X-Request-Id", "<none>") << "\n\n";
    }

    // 3. POST with a JSON body
    Json payload = {{"name", "sturdy"}, {"retries", 2}};
    std::cout << "POST /post\n";
    auto posted = client.post("/post", payload.dump(), {{"Content-Type", "application/json"}});
    if (!posted) {
        std::cerr << "  failed: " << posted.error().message() << "\n";
        return 1;
    }
    std::cout << "  status: " << posted->status_code << "\n\n";

    // 4. Error responses come back as CallError with the body attached
    std::cout << "GET /status/404\n";
    auto missing = client.get("/status/404");
    if (!missing) {
        std::cout << "  status: " << missing.error().status_code
                  << ", attempts: " << missing.error().attempts << "\n";
    }

    client.shutdown();
    std::cout << "\n=== Done ===\n";
    return 0;
}
