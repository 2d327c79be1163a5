#pragma once

#include "libmotionts/core/channel_schema.hpp"
#include "libmotionts/core/errors.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <string>
#include <vector>

namespace libmotionts {
namespace core {

/**
 * Observation matrix helpers
 *
 * An observation matrix is an Eigen::MatrixXd whose rows are time steps in
 * temporal order and whose columns are channels. These helpers convert from
 * row-major nested vectors (the shape produced by motion-capture readers),
 * validate shape and content, and slice channels by index or by name.
 */
struct ObservationMatrix {
	/**
	 * Build a matrix from rows
	 *
	 * @param rows Time-ordered rows, all of the same length
	 * @return Matrix (rows.size() × rows[0].size())
	 * @throws InvalidInputError if rows is empty, a row is empty, or rows are jagged
	 */
	static Eigen::MatrixXd FromRows(const std::vector<std::vector<double>> &rows) {
		if (rows.empty()) {
			throw InvalidInputError("observation matrix has no rows");
		}
		const size_t n_cols = rows[0].size();
		if (n_cols == 0) {
			throw InvalidInputError("observation matrix has no columns");
		}

		Eigen::MatrixXd m(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(n_cols));
		for (size_t i = 0; i < rows.size(); i++) {
			if (rows[i].size() != n_cols) {
				throw InvalidInputError("row " + std::to_string(i) + " has " + std::to_string(rows[i].size()) +
				                        " values, expected " + std::to_string(n_cols));
			}
			for (size_t j = 0; j < n_cols; j++) {
				m(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = rows[i][j];
			}
		}
		return m;
	}

	/// Convert back to nested rows
	static std::vector<std::vector<double>> ToRows(const Eigen::MatrixXd &m) {
		std::vector<std::vector<double>> rows(static_cast<size_t>(m.rows()));
		for (Eigen::Index i = 0; i < m.rows(); i++) {
			rows[static_cast<size_t>(i)].resize(static_cast<size_t>(m.cols()));
			for (Eigen::Index j = 0; j < m.cols(); j++) {
				rows[static_cast<size_t>(i)][static_cast<size_t>(j)] = m(i, j);
			}
		}
		return rows;
	}

	/**
	 * Reject empty matrices and non-finite values
	 *
	 * @param m Matrix to validate
	 * @param what Name used in the error message
	 * @throws InvalidInputError
	 */
	static void Validate(const Eigen::MatrixXd &m, const std::string &what) {
		if (m.rows() == 0 || m.cols() == 0) {
			throw InvalidInputError(what + " is empty");
		}
		for (Eigen::Index j = 0; j < m.cols(); j++) {
			for (Eigen::Index i = 0; i < m.rows(); i++) {
				if (!std::isfinite(m(i, j))) {
					throw InvalidInputError(what + " contains a non-finite value at row " + std::to_string(i) +
					                        ", column " + std::to_string(j));
				}
			}
		}
	}

	/// Columns by index, in the given order
	static Eigen::MatrixXd SelectColumns(const Eigen::MatrixXd &m, const std::vector<size_t> &indices) {
		Eigen::MatrixXd out(m.rows(), static_cast<Eigen::Index>(indices.size()));
		for (size_t k = 0; k < indices.size(); k++) {
			if (indices[k] >= static_cast<size_t>(m.cols())) {
				throw DimensionMismatchError("column index " + std::to_string(indices[k]) + " out of range (matrix has " +
				                             std::to_string(m.cols()) + " columns)");
			}
			out.col(static_cast<Eigen::Index>(k)) = m.col(static_cast<Eigen::Index>(indices[k]));
		}
		return out;
	}

	/**
	 * Columns by channel name
	 *
	 * @throws DimensionMismatchError if the matrix width does not match the schema
	 * @throws ColumnNotFoundError if a name is not in the schema
	 */
	static Eigen::MatrixXd SelectChannels(const Eigen::MatrixXd &m, const ChannelSchema &schema,
	                                      const std::vector<std::string> &names) {
		CheckWidth(m, schema);
		return SelectColumns(m, schema.Resolve(names));
	}

	static Eigen::VectorXd Channel(const Eigen::MatrixXd &m, const ChannelSchema &schema, const std::string &name) {
		CheckWidth(m, schema);
		return m.col(static_cast<Eigen::Index>(schema.IndexOf(name)));
	}

	static void CheckWidth(const Eigen::MatrixXd &m, const ChannelSchema &schema) {
		if (static_cast<size_t>(m.cols()) != schema.size()) {
			throw DimensionMismatchError("matrix has " + std::to_string(m.cols()) + " columns but schema describes " +
			                             std::to_string(schema.size()) + " channels");
		}
	}
};

} // namespace core
} // namespace libmotionts
