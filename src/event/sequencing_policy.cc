#include "sequencing_policy.h"

namespace Cadence {

namespace {
constexpr int64_t kSequentialPolicyKey = 0;
}

std::optional<SequenceKey> FullConcurrencyPolicy::GetSequenceKeyFor(const Event& /*event*/) const {
    return std::nullopt;
}

std::optional<SequenceKey> SequentialPolicy::GetSequenceKeyFor(const Event& /*event*/) const {
    return SequenceKey(kSequentialPolicyKey);
}

std::optional<SequenceKey> SequentialPerAggregatePolicy::GetSequenceKeyFor(const Event& event) const {
    const auto* domain_event = dynamic_cast<const DomainEvent*>(&event);
    if (domain_event == nullptr) {
        return std::nullopt;
    }
    return SequenceKey(domain_event->GetAggregateIdentifier());
}

} // namespace Cadence
