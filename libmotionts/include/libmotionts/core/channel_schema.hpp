#pragma once

#include "libmotionts/core/errors.hpp"
#include <string>
#include <utility>
#include <vector>

namespace libmotionts {
namespace core {

/**
 * ChannelSchema: ordered list of named channels (observation matrix columns)
 *
 * Column order is positional and significant: channel i of the schema is
 * column i of every matrix it describes. The schema is threaded through the
 * scaler, the models and the forecasting strategies so that a misnamed or
 * missing channel fails fast with ColumnNotFoundError instead of silently
 * reading the wrong column.
 *
 * Names must be non-empty and unique.
 */
class ChannelSchema {
public:
	ChannelSchema() = default;

	explicit ChannelSchema(std::vector<std::string> names) : names_(std::move(names)) {
		for (size_t i = 0; i < names_.size(); i++) {
			if (names_[i].empty()) {
				throw InvalidInputError("channel name at position " + std::to_string(i) + " is empty");
			}
			for (size_t j = 0; j < i; j++) {
				if (names_[j] == names_[i]) {
					throw InvalidInputError("duplicate channel name '" + names_[i] + "'");
				}
			}
		}
	}

	size_t size() const {
		return names_.size();
	}

	bool empty() const {
		return names_.empty();
	}

	const std::vector<std::string> &names() const {
		return names_;
	}

	const std::string &NameAt(size_t index) const {
		if (index >= names_.size()) {
			throw DimensionMismatchError("channel index " + std::to_string(index) + " out of range (schema has " +
			                             std::to_string(names_.size()) + " channels)");
		}
		return names_[index];
	}

	bool Contains(const std::string &name) const {
		for (const auto &n : names_) {
			if (n == name) {
				return true;
			}
		}
		return false;
	}

	/**
	 * Column index of a channel
	 *
	 * @throws ColumnNotFoundError if the channel is not part of the schema
	 */
	size_t IndexOf(const std::string &name) const {
		for (size_t i = 0; i < names_.size(); i++) {
			if (names_[i] == name) {
				return i;
			}
		}
		throw ColumnNotFoundError(name);
	}

	/**
	 * Column indices for a list of channels, in the requested order
	 *
	 * @throws ColumnNotFoundError on the first missing channel
	 */
	std::vector<size_t> Resolve(const std::vector<std::string> &names) const {
		std::vector<size_t> indices;
		indices.reserve(names.size());
		for (const auto &name : names) {
			indices.push_back(IndexOf(name));
		}
		return indices;
	}

	/// Sub-schema with only the given channels, in the given order
	ChannelSchema Select(const std::vector<std::string> &names) const {
		Resolve(names);
		return ChannelSchema(names);
	}

	bool operator==(const ChannelSchema &other) const {
		return names_ == other.names_;
	}

	bool operator!=(const ChannelSchema &other) const {
		return !(*this == other);
	}

private:
	std::vector<std::string> names_;
};

} // namespace core
} // namespace libmotionts
