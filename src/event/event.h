#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>

namespace Cadence {

/**
 * Base of everything that flows through the dispatcher.
 * Events are immutable once published and are shared read-only between the
 * publisher and the handler that eventually consumes them.
 */
class Event {
	public:
		virtual ~Event() = default;

		// Runtime type used by listeners to accept or reject the event
		std::type_index Type() const { return std::type_index(typeid(*this)); }
		const char* TypeName() const { return typeid(*this).name(); }
};

using EventPtr = std::shared_ptr<const Event>;

/**
 * Event raised by an aggregate. Carries the aggregate it belongs to and its
 * position in that aggregate's stream.
 */
class DomainEvent : public Event {
	public:
		DomainEvent(std::string aggregate_identifier, int64_t sequence_number)
			: aggregate_identifier_(std::move(aggregate_identifier)),
			sequence_number_(sequence_number) {}

		const std::string& GetAggregateIdentifier() const { return aggregate_identifier_; }
		int64_t GetSequenceNumber() const { return sequence_number_; }

	private:
		std::string aggregate_identifier_;
		int64_t sequence_number_;
};

} // namespace Cadence
