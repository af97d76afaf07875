#include "sequence_key.h"

namespace Cadence {

std::string SequenceKey::ToString() const {
	if (IsNumeric()) {
		return std::to_string(std::get<int64_t>(value_));
	}
	return std::get<std::string>(value_);
}

std::ostream& operator<<(std::ostream& os, const SequenceKey& key) {
	return os << key.ToString();
}

} // namespace Cadence
