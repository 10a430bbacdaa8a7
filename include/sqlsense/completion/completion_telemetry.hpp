#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sqlsense::completion {

struct CompletionTelemetrySnapshot final {
    std::uint64_t requests = 0U;
    std::uint64_t smart_requests = 0U;
    std::uint64_t dumb_requests = 0U;
    std::uint64_t suggestions_dispatched = 0U;
    std::uint64_t unrecognized_suggestions = 0U;
    std::uint64_t candidates_considered = 0U;
    std::uint64_t completions_emitted = 0U;
    std::uint64_t total_duration_ns = 0U;
    std::uint64_t last_duration_ns = 0U;
};

class CompletionTelemetry final {
public:
    void record_request(bool smart) noexcept;
    void record_suggestion(bool recognized) noexcept;
    void record_ranking(std::size_t candidates, std::size_t completions) noexcept;
    void record_duration(std::uint64_t duration_ns) noexcept;

    [[nodiscard]] CompletionTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    static void add_relaxed(std::atomic<std::uint64_t>& target, std::uint64_t value) noexcept;

    std::atomic<std::uint64_t> requests_{0U};
    std::atomic<std::uint64_t> smart_requests_{0U};
    std::atomic<std::uint64_t> dumb_requests_{0U};
    std::atomic<std::uint64_t> suggestions_dispatched_{0U};
    std::atomic<std::uint64_t> unrecognized_suggestions_{0U};
    std::atomic<std::uint64_t> candidates_considered_{0U};
    std::atomic<std::uint64_t> completions_emitted_{0U};
    std::atomic<std::uint64_t> total_duration_ns_{0U};
    std::atomic<std::uint64_t> last_duration_ns_{0U};
};

class CompletionTelemetryRegistry final {
public:
    using Sampler = std::function<CompletionTelemetrySnapshot()>;
    using Visitor = std::function<void(const std::string&, const CompletionTelemetrySnapshot&)>;

    void register_sampler(std::string identifier, Sampler sampler);
    void unregister_sampler(const std::string& identifier);

    [[nodiscard]] CompletionTelemetrySnapshot aggregate() const;
    void visit(const Visitor& visitor) const;

private:
    mutable std::mutex mutex_{};
    std::unordered_map<std::string, Sampler> samplers_{};
};

}  // namespace sqlsense::completion
