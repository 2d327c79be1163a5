#pragma once

#include "libmotionts/core/channel_schema.hpp"
#include "libmotionts/core/errors.hpp"
#include "libmotionts/core/observation_matrix.hpp"
#include "libmotionts/core/pipeline_config.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <memory>
#include <string>
#include <vector>

namespace libmotionts {
namespace preprocessing {

/**
 * IScaler: per-column normalization fitted once on training data
 *
 * Lifecycle: created empty, populated once by Fit(), then only read.
 * Transform() and InverseTransform() may be called any number of times.
 *
 * Caller contract: fit on training data only and reuse the same scaler for
 * test data. Refitting on inference data leaks test statistics into the
 * normalization; nothing here can detect that.
 */
class IScaler {
public:
	virtual ~IScaler() = default;

	virtual core::ScalerKind GetKind() const = 0;

	/**
	 * Compute per-column parameters
	 *
	 * @param data Observation matrix (n × c), n >= 1
	 * @throws InvalidInputError if data is empty or contains non-finite values
	 */
	virtual void Fit(const Eigen::MatrixXd &data) = 0;

	/**
	 * Fit and bind a channel schema, enabling name-based column access
	 *
	 * @throws DimensionMismatchError if data width differs from the schema
	 */
	virtual void Fit(const Eigen::MatrixXd &data, const core::ChannelSchema &schema) = 0;

	virtual bool IsFitted() const = 0;

	/**
	 * @throws NotFittedError before Fit()
	 * @throws DimensionMismatchError if the column count differs from the fitted one
	 */
	virtual Eigen::MatrixXd Transform(const Eigen::MatrixXd &data) const = 0;

	virtual Eigen::MatrixXd InverseTransform(const Eigen::MatrixXd &data) const = 0;

	Eigen::MatrixXd FitTransform(const Eigen::MatrixXd &data) {
		Fit(data);
		return Transform(data);
	}

	Eigen::MatrixXd FitTransform(const Eigen::MatrixXd &data, const core::ChannelSchema &schema) {
		Fit(data, schema);
		return Transform(data);
	}

	/**
	 * Denormalize values of a single column
	 *
	 * @param values Normalized values of column `column`
	 * @param column Column index in the fitted layout
	 */
	virtual Eigen::VectorXd InverseTransformColumn(const Eigen::VectorXd &values, size_t column) const = 0;

	/**
	 * Denormalize values of a single channel by name
	 *
	 * @throws NotFittedError if no schema was bound at fit time
	 * @throws ColumnNotFoundError if the channel is unknown
	 */
	virtual Eigen::VectorXd InverseTransformChannel(const Eigen::VectorXd &values,
	                                                const std::string &channel) const = 0;

	/// Schema bound at fit time (empty if fitted without one)
	virtual const core::ChannelSchema &schema() const = 0;

	virtual size_t n_columns() const = 0;
};

/**
 * AffineScaler: shared implementation of x' = (x - offset) / scale
 *
 * Both standardization (offset = mean, scale = std) and range scaling
 * (offset = min, scale = max - min) are affine per column. Subclasses only
 * compute the parameters. Invariant: scale[i] > 0 for every column.
 */
class AffineScaler : public IScaler {
public:
	void Fit(const Eigen::MatrixXd &data) override {
		core::ObservationMatrix::Validate(data, "scaler training data");
		ComputeParameters(data, offset_, scale_);
		for (Eigen::Index j = 0; j < scale_.size(); j++) {
			// Zero-variance columns: identity shift by the offset
			if (!(scale_(j) > 0.0)) {
				scale_(j) = 1.0;
			}
		}
		schema_ = core::ChannelSchema();
		fitted_ = true;
	}

	void Fit(const Eigen::MatrixXd &data, const core::ChannelSchema &schema) override {
		core::ObservationMatrix::CheckWidth(data, schema);
		Fit(data);
		schema_ = schema;
	}

	bool IsFitted() const override {
		return fitted_;
	}

	Eigen::MatrixXd Transform(const Eigen::MatrixXd &data) const override {
		CheckCompatible(data);
		Eigen::MatrixXd out = data;
		for (Eigen::Index j = 0; j < data.cols(); j++) {
			out.col(j) = (data.col(j).array() - offset_(j)) / scale_(j);
		}
		return out;
	}

	Eigen::MatrixXd InverseTransform(const Eigen::MatrixXd &data) const override {
		CheckCompatible(data);
		Eigen::MatrixXd out = data;
		for (Eigen::Index j = 0; j < data.cols(); j++) {
			out.col(j) = data.col(j).array() * scale_(j) + offset_(j);
		}
		return out;
	}

	Eigen::VectorXd InverseTransformColumn(const Eigen::VectorXd &values, size_t column) const override {
		RequireFitted();
		if (column >= static_cast<size_t>(offset_.size())) {
			throw core::DimensionMismatchError("column " + std::to_string(column) + " out of range (scaler fitted on " +
			                                   std::to_string(offset_.size()) + " columns)");
		}
		auto c = static_cast<Eigen::Index>(column);
		return (values.array() * scale_(c) + offset_(c)).matrix();
	}

	Eigen::VectorXd InverseTransformChannel(const Eigen::VectorXd &values, const std::string &channel) const override {
		RequireFitted();
		if (schema_.empty()) {
			throw core::NotFittedError("scaler was fitted without a channel schema");
		}
		return InverseTransformColumn(values, schema_.IndexOf(channel));
	}

	const core::ChannelSchema &schema() const override {
		return schema_;
	}

	size_t n_columns() const override {
		return static_cast<size_t>(offset_.size());
	}

	const Eigen::VectorXd &offset() const {
		return offset_;
	}

	const Eigen::VectorXd &scale() const {
		return scale_;
	}

	/**
	 * Restore a previously fitted state (model import)
	 *
	 * @throws InvalidInputError if sizes differ or a scale is not positive
	 */
	void Restore(const Eigen::VectorXd &offset, const Eigen::VectorXd &scale, const core::ChannelSchema &schema) {
		if (offset.size() != scale.size() || offset.size() == 0) {
			throw core::InvalidInputError("scaler parameters must be non-empty and of equal length");
		}
		if (!schema.empty() && schema.size() != static_cast<size_t>(offset.size())) {
			throw core::InvalidInputError("scaler schema does not match parameter length");
		}
		for (Eigen::Index j = 0; j < scale.size(); j++) {
			if (!(scale(j) > 0.0) || !std::isfinite(offset(j))) {
				throw core::InvalidInputError("invalid scaler parameters at column " + std::to_string(j));
			}
		}
		offset_ = offset;
		scale_ = scale;
		schema_ = schema;
		fitted_ = true;
	}

protected:
	virtual void ComputeParameters(const Eigen::MatrixXd &data, Eigen::VectorXd &offset,
	                               Eigen::VectorXd &scale) const = 0;

	virtual std::string Name() const = 0;

private:
	void RequireFitted() const {
		if (!fitted_) {
			throw core::NotFittedError(Name() + " not fitted");
		}
	}

	void CheckCompatible(const Eigen::MatrixXd &data) const {
		RequireFitted();
		if (data.cols() != offset_.size()) {
			throw core::DimensionMismatchError(Name() + " fitted on " + std::to_string(offset_.size()) +
			                                   " columns, got " + std::to_string(data.cols()));
		}
	}

	Eigen::VectorXd offset_;
	Eigen::VectorXd scale_;
	core::ChannelSchema schema_;
	bool fitted_ = false;
};

/**
 * StandardScaler: (x - mean) / std with the population standard deviation
 */
class StandardScaler : public AffineScaler {
public:
	core::ScalerKind GetKind() const override {
		return core::ScalerKind::STANDARD;
	}

	const Eigen::VectorXd &mean() const {
		return offset();
	}

	const Eigen::VectorXd &stddev() const {
		return scale();
	}

protected:
	void ComputeParameters(const Eigen::MatrixXd &data, Eigen::VectorXd &offset,
	                       Eigen::VectorXd &scale) const override {
		const double n = static_cast<double>(data.rows());
		offset = data.colwise().mean().transpose();
		scale.resize(data.cols());
		for (Eigen::Index j = 0; j < data.cols(); j++) {
			double variance = (data.col(j).array() - offset(j)).square().sum() / n;
			scale(j) = std::sqrt(variance);
		}
	}

	std::string Name() const override {
		return "StandardScaler";
	}
};

/**
 * MinMaxScaler: (x - min) / (max - min), mapping the training range to [0, 1]
 */
class MinMaxScaler : public AffineScaler {
public:
	core::ScalerKind GetKind() const override {
		return core::ScalerKind::MINMAX;
	}

	const Eigen::VectorXd &min() const {
		return offset();
	}

	/// max - min per column (1 for constant columns)
	const Eigen::VectorXd &range() const {
		return scale();
	}

protected:
	void ComputeParameters(const Eigen::MatrixXd &data, Eigen::VectorXd &offset,
	                       Eigen::VectorXd &scale) const override {
		offset = data.colwise().minCoeff().transpose();
		scale = data.colwise().maxCoeff().transpose() - offset;
	}

	std::string Name() const override {
		return "MinMaxScaler";
	}
};

inline std::unique_ptr<AffineScaler> MakeScaler(core::ScalerKind kind) {
	switch (kind) {
	case core::ScalerKind::STANDARD:
		return std::make_unique<StandardScaler>();
	case core::ScalerKind::MINMAX:
		return std::make_unique<MinMaxScaler>();
	default:
		throw core::InvalidInputError("unknown scaler kind");
	}
}

} // namespace preprocessing
} // namespace libmotionts
