#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

struct Endpoint {
    std::string url;
    int priority = 0;
    std::optional<int64_t> latency_ms;  // as configured, e.g. from a provider benchmark
};

// Ordered JSON-RPC endpoints with a sticky "current" pointer.
// The pointer is unsynchronized: one pool per logical caller, or guard it externally.
class EndpointPool {
public:
    explicit EndpointPool(const std::vector<std::string>& urls);
    explicit EndpointPool(std::vector<Endpoint> endpoints);

    const Endpoint& current() const { return endpoints_[current_]; }
    const Endpoint& at(size_t index) const { return endpoints_.at(index); }
    size_t current_index() const { return current_; }
    size_t size() const { return endpoints_.size(); }
    const std::vector<Endpoint>& endpoints() const { return endpoints_; }

    // Moves the pointer to the next endpoint, wrapping at the end.
    size_t advance();
    void pin(size_t index);

    void record_latency(size_t index, int64_t latency_ms);
    std::optional<int64_t> latency_of(size_t index) const;

private:
    std::vector<Endpoint> endpoints_;
    std::vector<std::optional<int64_t>> observed_;
    size_t current_;
};
