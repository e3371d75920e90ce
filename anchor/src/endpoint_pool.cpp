#include "endpoint_pool.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

EndpointPool::EndpointPool(const std::vector<std::string>& urls)
    : current_(0)
{
    int priority = 0;
    for (const auto& url : urls) {
        Endpoint ep;
        ep.url = url;
        ep.priority = priority++;
        endpoints_.push_back(ep);
    }

    if (endpoints_.empty()) {
        throw ValidationError("Endpoint pool requires at least one URL");
    }
    observed_.resize(endpoints_.size());
}

EndpointPool::EndpointPool(std::vector<Endpoint> endpoints)
    : endpoints_(std::move(endpoints))
    , current_(0)
{
    if (endpoints_.empty()) {
        throw ValidationError("Endpoint pool requires at least one URL");
    }

    std::stable_sort(endpoints_.begin(), endpoints_.end(),
                     [](const Endpoint& a, const Endpoint& b) { return a.priority < b.priority; });
    observed_.resize(endpoints_.size());
}

size_t EndpointPool::advance() {
    current_ = (current_ + 1) % endpoints_.size();
    spdlog::warn("Rotated to RPC endpoint: {}", util::redact_url(endpoints_[current_].url));
    return current_;
}

void EndpointPool::pin(size_t index) {
    if (index >= endpoints_.size()) {
        throw ValidationError("Endpoint index out of range: " + std::to_string(index));
    }
    current_ = index;
}

void EndpointPool::record_latency(size_t index, int64_t latency_ms) {
    if (index < observed_.size()) {
        observed_[index] = latency_ms;
    }
}

std::optional<int64_t> EndpointPool::latency_of(size_t index) const {
    if (index >= endpoints_.size()) return std::nullopt;
    if (observed_[index].has_value()) return observed_[index];
    return endpoints_[index].latency_ms;
}
