#include "sqlsense/completion/completion_telemetry.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace sqlsense::completion {
namespace {

CompletionTelemetrySnapshot& accumulate(CompletionTelemetrySnapshot& target, const CompletionTelemetrySnapshot& source)
{
    target.requests += source.requests;
    target.smart_requests += source.smart_requests;
    target.dumb_requests += source.dumb_requests;
    target.suggestions_dispatched += source.suggestions_dispatched;
    target.unrecognized_suggestions += source.unrecognized_suggestions;
    target.candidates_considered += source.candidates_considered;
    target.completions_emitted += source.completions_emitted;
    target.total_duration_ns += source.total_duration_ns;
    target.last_duration_ns = std::max(target.last_duration_ns, source.last_duration_ns);
    return target;
}

}  // namespace

void CompletionTelemetry::add_relaxed(std::atomic<std::uint64_t>& target, std::uint64_t value) noexcept
{
    target.fetch_add(value, std::memory_order_relaxed);
}

void CompletionTelemetry::record_request(bool smart) noexcept
{
    add_relaxed(requests_, 1U);
    add_relaxed(smart ? smart_requests_ : dumb_requests_, 1U);
}

void CompletionTelemetry::record_suggestion(bool recognized) noexcept
{
    add_relaxed(suggestions_dispatched_, 1U);
    if (!recognized) {
        add_relaxed(unrecognized_suggestions_, 1U);
    }
}

void CompletionTelemetry::record_ranking(std::size_t candidates, std::size_t completions) noexcept
{
    add_relaxed(candidates_considered_, static_cast<std::uint64_t>(candidates));
    add_relaxed(completions_emitted_, static_cast<std::uint64_t>(completions));
}

void CompletionTelemetry::record_duration(std::uint64_t duration_ns) noexcept
{
    add_relaxed(total_duration_ns_, duration_ns);
    last_duration_ns_.store(duration_ns, std::memory_order_relaxed);
}

CompletionTelemetrySnapshot CompletionTelemetry::snapshot() const noexcept
{
    CompletionTelemetrySnapshot snapshot{};
    snapshot.requests = requests_.load(std::memory_order_relaxed);
    snapshot.smart_requests = smart_requests_.load(std::memory_order_relaxed);
    snapshot.dumb_requests = dumb_requests_.load(std::memory_order_relaxed);
    snapshot.suggestions_dispatched = suggestions_dispatched_.load(std::memory_order_relaxed);
    snapshot.unrecognized_suggestions = unrecognized_suggestions_.load(std::memory_order_relaxed);
    snapshot.candidates_considered = candidates_considered_.load(std::memory_order_relaxed);
    snapshot.completions_emitted = completions_emitted_.load(std::memory_order_relaxed);
    snapshot.total_duration_ns = total_duration_ns_.load(std::memory_order_relaxed);
    snapshot.last_duration_ns = last_duration_ns_.load(std::memory_order_relaxed);
    return snapshot;
}

void CompletionTelemetry::reset() noexcept
{
    requests_.store(0U, std::memory_order_relaxed);
    smart_requests_.store(0U, std::memory_order_relaxed);
    dumb_requests_.store(0U, std::memory_order_relaxed);
    suggestions_dispatched_.store(0U, std::memory_order_relaxed);
    unrecognized_suggestions_.store(0U, std::memory_order_relaxed);
    candidates_considered_.store(0U, std::memory_order_relaxed);
    completions_emitted_.store(0U, std::memory_order_relaxed);
    total_duration_ns_.store(0U, std::memory_order_relaxed);
    last_duration_ns_.store(0U, std::memory_order_relaxed);
}

void CompletionTelemetryRegistry::register_sampler(std::string identifier, Sampler sampler)
{
    if (!sampler) {
        return;
    }

    std::lock_guard guard(mutex_);
    samplers_.insert_or_assign(std::move(identifier), std::move(sampler));
}

void CompletionTelemetryRegistry::unregister_sampler(const std::string& identifier)
{
    std::lock_guard guard(mutex_);
    samplers_.erase(identifier);
}

CompletionTelemetrySnapshot CompletionTelemetryRegistry::aggregate() const
{
    std::vector<Sampler> samplers;
    {
        std::lock_guard guard(mutex_);
        samplers.reserve(samplers_.size());
        for (const auto& [_, sampler] : samplers_) {
            samplers.push_back(sampler);
        }
    }

    CompletionTelemetrySnapshot total{};
    for (const auto& sampler : samplers) {
        accumulate(total, sampler());
    }
    return total;
}

void CompletionTelemetryRegistry::visit(const Visitor& visitor) const
{
    if (!visitor) {
        return;
    }

    std::vector<std::pair<std::string, Sampler>> entries;
    {
        std::lock_guard guard(mutex_);
        entries.reserve(samplers_.size());
        for (const auto& [identifier, sampler] : samplers_) {
            entries.emplace_back(identifier, sampler);
        }
    }

    for (const auto& [identifier, sampler] : entries) {
        visitor(identifier, sampler());
    }
}

}  // namespace sqlsense::completion
