#pragma once

#include "libmotionts/core/channel_schema.hpp"
#include "libmotionts/core/errors.hpp"
#include "libmotionts/core/model_options.hpp"
#include "libmotionts/core/observation_matrix.hpp"
#include "libmotionts/core/pipeline_config.hpp"
#include "libmotionts/models/arx_model.hpp"
#include "libmotionts/models/forecast_pipeline.hpp"
#include "libmotionts/models/movement_model.hpp"
#include "libmotionts/models/var_model.hpp"
#include "libmotionts/preprocessing/scaler.hpp"
#include <Eigen/Dense>
#include <fstream>
#include <memory>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

namespace libmotionts {
namespace io {

using json = nlohmann::json;

/**
 * ModelSerializer: JSON export/import of trained models
 *
 * Layouts (matrices are arrays of rows):
 *
 *   AR-X model:  {"type": "arx", "order", "target", "exogenous", "labels", "coefficients"}
 *   VAR model:   {"type": "var", "lags", "variables", "labels", "params", "pvalues"}
 *   Scaler:      {"kind": "standard"|"minmax", "channels", "offset", "scale"}
 *   Config:      {"target", "exogenous", "order", "strategy", "scaler"}
 *   Pipeline:    {"config", "scaler", "model"}
 *   Movement:    {"variables", "lags", "model", "coefficients", "pvalues"}
 *
 * Every *FromJson function throws InvalidInputError on a malformed document
 * (missing keys, wrong types, inconsistent sizes). Documents carry no
 * version field.
 */
class ModelSerializer {
public:
	static json ToJson(const models::ArxModel &model);
	static models::ArxModel ArxModelFromJson(const json &doc);

	static json ToJson(const models::VarModel &model);
	static models::VarModel VarModelFromJson(const json &doc);

	static json ToJson(const preprocessing::AffineScaler &scaler);
	static std::unique_ptr<preprocessing::AffineScaler> ScalerFromJson(const json &doc);

	static json ToJson(const core::PipelineConfig &config);
	/// Unknown keys are rejected; "order", "strategy" and "scaler" are optional
	static core::PipelineConfig PipelineConfigFromJson(const json &doc);

	static json ToJson(const models::ForecastPipeline &pipeline);
	static models::ForecastPipeline PipelineFromJson(const json &doc);

	static json ToJson(const models::MovementModel &model);
	static models::MovementModel MovementModelFromJson(const json &doc);

	/// @throws InvalidInputError if the file cannot be written
	static void SaveJson(const std::string &path, const json &doc);

	/// @throws InvalidInputError if the file cannot be read or parsed
	static json LoadJson(const std::string &path);

	static json MatrixToJson(const Eigen::MatrixXd &m);
	static Eigen::MatrixXd MatrixFromJson(const json &doc);
	static json VectorToJson(const Eigen::VectorXd &v);
	static Eigen::VectorXd VectorFromJson(const json &doc);

private:
	static void RequireObject(const json &doc, const std::string &what);
	static void RequireType(const json &doc, const std::string &type);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline void ModelSerializer::RequireObject(const json &doc, const std::string &what) {
	if (!doc.is_object()) {
		throw core::InvalidInputError(what + " document must be a JSON object");
	}
}

inline void ModelSerializer::RequireType(const json &doc, const std::string &type) {
	RequireObject(doc, type + " model");
	auto it = doc.find("type");
	if (it == doc.end() || !it->is_string() || it->get<std::string>() != type) {
		throw core::InvalidInputError("expected a document of type '" + type + "'");
	}
}

inline json ModelSerializer::VectorToJson(const Eigen::VectorXd &v) {
	json out = json::array();
	for (Eigen::Index i = 0; i < v.size(); i++) {
		out.push_back(v(i));
	}
	return out;
}

inline Eigen::VectorXd ModelSerializer::VectorFromJson(const json &doc) {
	if (!doc.is_array()) {
		throw core::InvalidInputError("expected a numeric array");
	}
	Eigen::VectorXd v(static_cast<Eigen::Index>(doc.size()));
	for (size_t i = 0; i < doc.size(); i++) {
		if (!doc[i].is_number()) {
			throw core::InvalidInputError("non-numeric value at index " + std::to_string(i));
		}
		v(static_cast<Eigen::Index>(i)) = doc[i].get<double>();
	}
	return v;
}

inline json ModelSerializer::MatrixToJson(const Eigen::MatrixXd &m) {
	json out = json::array();
	for (Eigen::Index i = 0; i < m.rows(); i++) {
		out.push_back(VectorToJson(m.row(i).transpose()));
	}
	return out;
}

inline Eigen::MatrixXd ModelSerializer::MatrixFromJson(const json &doc) {
	if (!doc.is_array()) {
		throw core::InvalidInputError("expected an array of rows");
	}
	if (doc.empty()) {
		return Eigen::MatrixXd();
	}
	std::vector<std::vector<double>> rows;
	rows.reserve(doc.size());
	for (const auto &row : doc) {
		Eigen::VectorXd v = VectorFromJson(row);
		rows.emplace_back(v.data(), v.data() + v.size());
	}
	return core::ObservationMatrix::FromRows(rows);
}

inline json ModelSerializer::ToJson(const models::ArxModel &model) {
	if (!model.IsTrained()) {
		throw core::NotFittedError("cannot export an untrained AR-X model");
	}
	json doc;
	doc["type"] = "arx";
	doc["order"] = model.order();
	doc["target"] = model.target_name();
	doc["exogenous"] = model.exogenous_names();
	doc["labels"] = model.labels();
	doc["coefficients"] = VectorToJson(model.coefficients());
	return doc;
}

inline models::ArxModel ModelSerializer::ArxModelFromJson(const json &doc) {
	RequireType(doc, "arx");
	try {
		auto order = doc.at("order").get<size_t>();
		auto target = doc.at("target").get<std::string>();
		auto exogenous = doc.at("exogenous").get<std::vector<std::string>>();
		Eigen::VectorXd coefficients = VectorFromJson(doc.at("coefficients"));
		models::ArxModel model(order, coefficients, target, exogenous);
		if (doc.contains("labels") && doc.at("labels").get<std::vector<std::string>>() != model.labels()) {
			throw core::InvalidInputError("AR-X labels do not match target, exogenous channels and order");
		}
		return model;
	} catch (const json::exception &e) {
		throw core::InvalidInputError(std::string("malformed AR-X model: ") + e.what());
	}
}

inline json ModelSerializer::ToJson(const models::VarModel &model) {
	if (!model.IsTrained()) {
		throw core::NotFittedError("cannot export an untrained VAR model");
	}
	json doc;
	doc["type"] = "var";
	doc["lags"] = model.lags();
	doc["variables"] = model.variable_names();
	doc["labels"] = model.labels();
	doc["params"] = MatrixToJson(model.params());
	doc["pvalues"] = MatrixToJson(model.p_values());
	return doc;
}

inline models::VarModel ModelSerializer::VarModelFromJson(const json &doc) {
	RequireType(doc, "var");
	try {
		auto lags = doc.at("lags").get<size_t>();
		auto variables = doc.at("variables").get<std::vector<std::string>>();
		Eigen::MatrixXd params = MatrixFromJson(doc.at("params"));
		Eigen::MatrixXd p_values = doc.contains("pvalues") ? MatrixFromJson(doc.at("pvalues")) : Eigen::MatrixXd();
		return models::VarModel(lags, variables, params, p_values);
	} catch (const json::exception &e) {
		throw core::InvalidInputError(std::string("malformed VAR model: ") + e.what());
	}
}

inline json ModelSerializer::ToJson(const preprocessing::AffineScaler &scaler) {
	if (!scaler.IsFitted()) {
		throw core::NotFittedError("cannot export an unfitted scaler");
	}
	json doc;
	doc["kind"] = core::ToString(scaler.GetKind());
	doc["channels"] = scaler.schema().names();
	doc["offset"] = VectorToJson(scaler.offset());
	doc["scale"] = VectorToJson(scaler.scale());
	return doc;
}

inline std::unique_ptr<preprocessing::AffineScaler> ModelSerializer::ScalerFromJson(const json &doc) {
	RequireObject(doc, "scaler");
	try {
		core::ScalerKind kind = core::ParseScalerKind(doc.at("kind").get<std::string>());
		auto channels = doc.value("channels", std::vector<std::string>());
		std::unique_ptr<preprocessing::AffineScaler> scaler = preprocessing::MakeScaler(kind);
		core::ChannelSchema schema = channels.empty() ? core::ChannelSchema() : core::ChannelSchema(channels);
		scaler->Restore(VectorFromJson(doc.at("offset")), VectorFromJson(doc.at("scale")), schema);
		return scaler;
	} catch (const json::exception &e) {
		throw core::InvalidInputError(std::string("malformed scaler: ") + e.what());
	}
}

inline json ModelSerializer::ToJson(const core::PipelineConfig &config) {
	json doc;
	doc["target"] = config.target_channel;
	doc["exogenous"] = config.exogenous_channels;
	doc["order"] = config.order;
	doc["strategy"] = core::ToString(config.strategy);
	doc["scaler"] = core::ToString(config.scaler);
	return doc;
}

inline core::PipelineConfig ModelSerializer::PipelineConfigFromJson(const json &doc) {
	RequireObject(doc, "pipeline configuration");
	static const std::set<std::string> known = {"target", "exogenous", "order", "strategy", "scaler"};
	for (auto it = doc.begin(); it != doc.end(); ++it) {
		if (known.count(it.key()) == 0) {
			throw core::InvalidInputError("unknown configuration key '" + it.key() + "'");
		}
	}
	try {
		core::PipelineConfig config;
		config.target_channel = doc.at("target").get<std::string>();
		config.exogenous_channels = doc.value("exogenous", std::vector<std::string>());
		if (doc.contains("order")) {
			const json &order = doc.at("order");
			if (!order.is_number_integer() || order.get<long long>() <= 0) {
				throw core::InvalidInputError("order must be a positive integer");
			}
			config.order = order.get<size_t>();
		}
		if (doc.contains("strategy")) {
			config.strategy = core::ParseForecastStrategy(doc.at("strategy").get<std::string>());
		}
		if (doc.contains("scaler")) {
			config.scaler = core::ParseScalerKind(doc.at("scaler").get<std::string>());
		}
		config.Validate();
		return config;
	} catch (const json::exception &e) {
		throw core::InvalidInputError(std::string("malformed pipeline configuration: ") + e.what());
	}
}

inline json ModelSerializer::ToJson(const models::ForecastPipeline &pipeline) {
	json doc;
	doc["config"] = ToJson(pipeline.config());
	doc["scaler"] = ToJson(pipeline.scaler());
	doc["model"] = ToJson(pipeline.model());
	return doc;
}

inline models::ForecastPipeline ModelSerializer::PipelineFromJson(const json &doc) {
	RequireObject(doc, "pipeline");
	if (!doc.contains("config") || !doc.contains("scaler") || !doc.contains("model")) {
		throw core::InvalidInputError("pipeline document needs 'config', 'scaler' and 'model'");
	}
	models::ForecastPipeline pipeline(PipelineConfigFromJson(doc.at("config")));
	pipeline.Restore(ArxModelFromJson(doc.at("model")), ScalerFromJson(doc.at("scaler")));
	return pipeline;
}

inline json ModelSerializer::ToJson(const models::MovementModel &model) {
	json doc;
	doc["variables"] = model.variables();
	doc["lags"] = model.model().lags();
	doc["model"] = ToJson(model.model());
	doc["coefficients"] = model.coefficients();
	doc["pvalues"] = model.p_values();
	return doc;
}

inline models::MovementModel ModelSerializer::MovementModelFromJson(const json &doc) {
	RequireObject(doc, "movement model");
	try {
		auto variables = doc.at("variables").get<std::vector<std::string>>();
		models::VarModel var = VarModelFromJson(doc.at("model"));
		core::VarOptions options = core::VarOptions::Lags(var.lags());
		models::MovementModel model(variables, options);
		model.Restore(var);
		return model;
	} catch (const json::exception &e) {
		throw core::InvalidInputError(std::string("malformed movement model: ") + e.what());
	}
}

inline void ModelSerializer::SaveJson(const std::string &path, const json &doc) {
	std::ofstream file(path);
	if (!file.is_open()) {
		throw core::InvalidInputError("failed to open file for writing: " + path);
	}
	file << doc.dump(2) << '\n';
	if (!file) {
		throw core::InvalidInputError("failed to write file: " + path);
	}
}

inline json ModelSerializer::LoadJson(const std::string &path) {
	std::ifstream file(path);
	if (!file.is_open()) {
		throw core::InvalidInputError("failed to open file: " + path);
	}
	try {
		json doc;
		file >> doc;
		return doc;
	} catch (const json::exception &e) {
		throw core::InvalidInputError("failed to parse " + path + ": " + e.what());
	}
}

} // namespace io
} // namespace libmotionts
