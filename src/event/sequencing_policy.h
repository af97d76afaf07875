#pragma once

#include <optional>

#include "event.h"
#include "sequence_key.h"

namespace Cadence {

/**
 * Decides which events must be handled sequentially.
 * Events for which the same key is returned are handled one at a time, in the
 * order they were added. An empty result allows full concurrency.
 * Implementations must be deterministic and free of side effects.
 */
class SequencingPolicy {
public:
    virtual ~SequencingPolicy() = default;

    virtual std::optional<SequenceKey> GetSequenceKeyFor(const Event& event) const = 0;
};

/**
 * Every event may be handled concurrently with any other.
 */
class FullConcurrencyPolicy : public SequencingPolicy {
public:
    std::optional<SequenceKey> GetSequenceKeyFor(const Event& event) const override;
};

/**
 * All events share one key, so the listener sees them strictly one by one.
 */
class SequentialPolicy : public SequencingPolicy {
public:
    std::optional<SequenceKey> GetSequenceKeyFor(const Event& event) const override;
};

/**
 * Events of the same aggregate are serialized; events of different aggregates,
 * and events that are not DomainEvents, run concurrently.
 */
class SequentialPerAggregatePolicy : public SequencingPolicy {
public:
    std::optional<SequenceKey> GetSequenceKeyFor(const Event& event) const override;
};

} // namespace Cadence
