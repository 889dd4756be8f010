#include "sturdy/http/transport.hpp"

#include <ranges>
#include <stdexcept>

namespace sturdy {

TransportPtr compose(TransportPtr base, const std::vector<Interceptor>& interceptors) {
    if (base == nullptr) {
        throw std::invalid_argument("compose: base transport cannot be null");
    }

    // Wrap innermost first so the first registered ends up outermost
    TransportPtr current = std::move(base);
    for (const auto& interceptor : interceptors | std::views::reverse) {
        if (interceptor == nullptr) {
            continue;
        }
        TransportPtr wrapped = interceptor(current);
        if (wrapped != nullptr) {
            current = std::move(wrapped);
        }
    }
    return current;
}

}  // namespace sturdy
