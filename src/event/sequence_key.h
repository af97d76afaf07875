#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

#include "absl/hash/hash.h"

namespace Cadence {

/**
 * Value that decides which serial queue processes an event.
 *
 * Keys compare by value: two events carrying equal keys are handled by the same
 * scheduler, no matter which objects produced them. An integer key never equals
 * a string key, even when they print the same.
 */
class SequenceKey {
	public:
		explicit SequenceKey(int64_t id) : value_(id) {}
		explicit SequenceKey(std::string id) : value_(std::move(id)) {}
		explicit SequenceKey(const char* id) : value_(std::string(id)) {}

		bool IsNumeric() const { return std::holds_alternative<int64_t>(value_); }

		std::string ToString() const;

		friend bool operator==(const SequenceKey& a, const SequenceKey& b) {
			return a.value_ == b.value_;
		}
		friend bool operator!=(const SequenceKey& a, const SequenceKey& b) {
			return !(a == b);
		}

		template <typename H>
		friend H AbslHashValue(H h, const SequenceKey& key) {
			return H::combine(std::move(h), key.value_);
		}

	private:
		std::variant<int64_t, std::string> value_;
};

std::ostream& operator<<(std::ostream& os, const SequenceKey& key);

} // namespace Cadence
