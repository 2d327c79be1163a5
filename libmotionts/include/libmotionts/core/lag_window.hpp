#pragma once

#include "libmotionts/core/errors.hpp"
#include <string>
#include <vector>

namespace libmotionts {
namespace core {

/**
 * LagWindow: fixed-capacity ring buffer of the most recent values
 *
 * Holds the last `capacity` observations of a series. Push() overwrites the
 * oldest entry once the window is full, so a rollout of any length runs in
 * constant memory. Lag(1) is the newest value, Lag(capacity) the oldest.
 *
 * Used for dynamic (multi-step) forecasting, where each prediction is pushed
 * back in as the next step's lag-1 input.
 */
template <typename T>
class LagWindow {
public:
	explicit LagWindow(size_t capacity) : buffer_(capacity), head_(0), size_(0) {
		if (capacity == 0) {
			throw InvalidInputError("lag window capacity must be positive");
		}
	}

	size_t capacity() const {
		return buffer_.size();
	}

	size_t size() const {
		return size_;
	}

	bool full() const {
		return size_ == buffer_.size();
	}

	void Push(const T &value) {
		buffer_[head_] = value;
		head_ = (head_ + 1) % buffer_.size();
		if (size_ < buffer_.size()) {
			size_++;
		}
	}

	/**
	 * Value `lag` steps back (1 = most recent)
	 *
	 * @throws DimensionMismatchError if fewer than `lag` values have been pushed
	 */
	const T &Lag(size_t lag) const {
		if (lag == 0 || lag > size_) {
			throw DimensionMismatchError("lag " + std::to_string(lag) + " not available (window holds " +
			                             std::to_string(size_) + " values)");
		}
		size_t idx = (head_ + buffer_.size() - lag) % buffer_.size();
		return buffer_[idx];
	}

	/// Values ordered lag-1, lag-2, ..., lag-size
	std::vector<T> NewestFirst() const {
		std::vector<T> out;
		out.reserve(size_);
		for (size_t lag = 1; lag <= size_; lag++) {
			out.push_back(Lag(lag));
		}
		return out;
	}

private:
	std::vector<T> buffer_;
	size_t head_;
	size_t size_;
};

} // namespace core
} // namespace libmotionts
