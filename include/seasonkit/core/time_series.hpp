#pragma once

#include "seasonkit/core/errors.hpp"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace seasonkit::core {

/**
 * @class TimeSeries
 * @brief An evenly spaced, univariate sequence of observations.
 *
 * Timestamps and values are kept in separate vectors. The name and metadata
 * are labels owned by the caller's ingestion layer; decompositions copy them
 * to their result unchanged.
 */
class TimeSeries {
public:
	using TimePoint = std::chrono::system_clock::time_point;
	using Value = double;
	using Metadata = std::unordered_map<std::string, std::string>;

	/**
	 * @brief Constructs a TimeSeries.
	 * @throws MismatchedLengthError If timestamps and values differ in length.
	 * @throws InvalidInputError If timestamps are not strictly increasing.
	 */
	TimeSeries(std::vector<TimePoint> timestamps, std::vector<Value> values, std::string name = {},
	           Metadata metadata = {})
	    : timestamps_(std::move(timestamps)), values_(std::move(values)), name_(std::move(name)),
	      metadata_(std::move(metadata)) {
		if (timestamps_.size() != values_.size()) {
			throw MismatchedLengthError("Timestamps and values vectors must have the same size.");
		}
		validateTimestampOrder();
	}

	/**
	 * @brief Builds a series with synthetic timestamps `start + i * step`.
	 */
	static TimeSeries fromValues(std::vector<Value> values, std::chrono::seconds step = std::chrono::seconds{1},
	                             TimePoint start = TimePoint{}, std::string name = {}) {
		std::vector<TimePoint> timestamps;
		timestamps.reserve(values.size());
		for (std::size_t i = 0; i < values.size(); ++i) {
			timestamps.push_back(start + step * static_cast<long long>(i));
		}
		TimeSeries series(std::move(timestamps), std::move(values), std::move(name));
		series.setFrequency(step);
		return series;
	}

	const std::vector<TimePoint> &getTimestamps() const {
		return timestamps_;
	}

	const std::vector<Value> &getValues() const {
		return values_;
	}

	std::size_t size() const {
		return values_.size();
	}

	bool isEmpty() const {
		return values_.empty();
	}

	const std::string &name() const {
		return name_;
	}

	void setName(std::string name) {
		name_ = std::move(name);
	}

	const Metadata &metadata() const {
		return metadata_;
	}

	void setMetadata(Metadata metadata) {
		metadata_ = std::move(metadata);
	}

	std::optional<std::chrono::nanoseconds> frequency() const {
		return frequency_;
	}

	void setFrequency(std::chrono::nanoseconds frequency) {
		frequency_ = frequency;
	}

	/**
	 * @brief True if any value is NaN or infinite.
	 */
	bool hasMissingValues() const {
		for (double v : values_) {
			if (!std::isfinite(v)) {
				return true;
			}
		}
		return false;
	}

private:
	void validateTimestampOrder() const {
		for (std::size_t i = 1; i < timestamps_.size(); ++i) {
			if (!(timestamps_[i] > timestamps_[i - 1])) {
				throw InvalidInputError("TimeSeries timestamps must be strictly increasing and unique.");
			}
		}
	}

	std::vector<TimePoint> timestamps_;
	std::vector<Value> values_;
	std::string name_;
	Metadata metadata_;
	std::optional<std::chrono::nanoseconds> frequency_;
};

} // namespace seasonkit::core
