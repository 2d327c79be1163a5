#include <catch2/catch_test_macros.hpp>

#include <libmotionts/io/model_serializer.hpp>
#include "../test_helpers.hpp"
#include <cstdio>
#include <fstream>
#include <string>

using namespace libmotionts;
using io::json;
using io::ModelSerializer;

namespace {

std::string TempPath(const std::string &name) {
	return std::string(P_tmpdir) + "/motionts_" + name;
}

} // namespace

TEST_CASE("ModelSerializer: AR-X model document", "[io][arx]") {
	Eigen::VectorXd coef(3);
	coef << 1.5, 0.6, 0.25;
	models::ArxModel model(2, coef, "LeftArm_Xrotation", {"Spine_Xrotation"});

	json doc = ModelSerializer::ToJson(model);
	REQUIRE(doc["type"].get<std::string>() == "arx");
	REQUIRE(doc["order"].get<size_t>() == 2);
	REQUIRE(doc["target"].get<std::string>() == "LeftArm_Xrotation");
	REQUIRE(doc["labels"][1].get<std::string>() == "LeftArm_Xrotation_T-1");
	REQUIRE(doc["coefficients"].size() == 3);

	models::ArxModel back = ModelSerializer::ArxModelFromJson(doc);
	REQUIRE(back.coefficients() == model.coefficients());
	REQUIRE(back.exogenous_names() == model.exogenous_names());

	SECTION("labels must agree with the shape") {
		doc["labels"][0] = "Neck_Xrotation";
		REQUIRE_THROWS_AS(ModelSerializer::ArxModelFromJson(doc), core::InvalidInputError);
	}

	SECTION("wrong type tag") {
		doc["type"] = "var";
		REQUIRE_THROWS_AS(ModelSerializer::ArxModelFromJson(doc), core::InvalidInputError);
	}

	SECTION("coefficient count must match") {
		doc["coefficients"] = json::array({1.0, 2.0});
		doc.erase("labels");
		REQUIRE_THROWS_AS(ModelSerializer::ArxModelFromJson(doc), core::InvalidInputError);
	}

	REQUIRE_THROWS_AS(ModelSerializer::ToJson(models::ArxModel()), core::NotFittedError);
}

TEST_CASE("ModelSerializer: VAR model document", "[io][var]") {
	auto channels = models::BodyChannels::Expand({"Neck"});
	test::Recording rec = test::SimulateVarRecording(channels, 120, 4);
	models::VarModel model = models::VarModel::FromFit(solvers::VarSolver::Fit(rec.data, core::VarOptions(), nullptr, channels));

	json doc = ModelSerializer::ToJson(model);
	REQUIRE(doc["type"].get<std::string>() == "var");
	REQUIRE(doc["params"].size() == 7);
	REQUIRE(doc["params"][0].size() == 3);
	REQUIRE(doc["pvalues"].size() == 3);

	models::VarModel back = ModelSerializer::VarModelFromJson(doc);
	REQUIRE(back.params() == model.params());
	REQUIRE(back.p_values() == model.p_values());
	REQUIRE(back.Predict(rec.data, 5) == model.Predict(rec.data, 5));

	doc["params"][2] = json::array({1.0});
	REQUIRE_THROWS_AS(ModelSerializer::VarModelFromJson(doc), core::InvalidInputError);
}

TEST_CASE("ModelSerializer: scaler document", "[io][scaler]") {
	test::Recording rec = test::SimulateArmRecording(100, 3);
	preprocessing::MinMaxScaler scaler;
	scaler.Fit(rec.data, rec.schema);

	json doc = ModelSerializer::ToJson(scaler);
	REQUIRE(doc["kind"].get<std::string>() == "minmax");
	REQUIRE(doc["channels"].size() == 4);

	auto back = ModelSerializer::ScalerFromJson(doc);
	REQUIRE(back->GetKind() == core::ScalerKind::MINMAX);
	REQUIRE(back->offset() == scaler.offset());
	REQUIRE(back->scale() == scaler.scale());
	REQUIRE(back->schema() == scaler.schema());

	doc["scale"][0] = 0.0;
	REQUIRE_THROWS_AS(ModelSerializer::ScalerFromJson(doc), core::InvalidInputError);
	doc["kind"] = "robust";
	REQUIRE_THROWS_AS(ModelSerializer::ScalerFromJson(doc), core::InvalidInputError);
}

TEST_CASE("ModelSerializer: pipeline configuration", "[io][config]") {
	json doc = json::parse(R"({"target": "LeftArm_Xrotation", "exogenous": ["Spine_Xrotation"], "strategy": "dynamic"})");
	core::PipelineConfig config = ModelSerializer::PipelineConfigFromJson(doc);
	REQUIRE(config.target_channel == "LeftArm_Xrotation");
	REQUIRE(config.exogenous_channels.size() == 1);
	REQUIRE(config.order == 2);
	REQUIRE(config.strategy == core::ForecastStrategyKind::DYNAMIC);
	REQUIRE(config.scaler == core::ScalerKind::STANDARD);

	json out = ModelSerializer::ToJson(config);
	REQUIRE(out["strategy"].get<std::string>() == "dynamic");
	REQUIRE(out["scaler"].get<std::string>() == "standard");

	SECTION("unknown key") {
		doc["lag"] = 3;
		REQUIRE_THROWS_AS(ModelSerializer::PipelineConfigFromJson(doc), core::InvalidInputError);
	}

	SECTION("invalid strategy") {
		doc["strategy"] = "rolling";
		REQUIRE_THROWS_AS(ModelSerializer::PipelineConfigFromJson(doc), core::InvalidInputError);
	}

	SECTION("invalid order") {
		doc["order"] = 0;
		REQUIRE_THROWS_AS(ModelSerializer::PipelineConfigFromJson(doc), core::InvalidInputError);
		doc["order"] = 1.5;
		REQUIRE_THROWS_AS(ModelSerializer::PipelineConfigFromJson(doc), core::InvalidInputError);
		doc["order"] = "two";
		REQUIRE_THROWS_AS(ModelSerializer::PipelineConfigFromJson(doc), core::InvalidInputError);
	}

	SECTION("missing target") {
		doc.erase("target");
		REQUIRE_THROWS_AS(ModelSerializer::PipelineConfigFromJson(doc), core::InvalidInputError);
	}
}

TEST_CASE("ModelSerializer: trained pipeline survives a file round trip", "[io][pipeline]") {
	test::Recording rec = test::SimulateArmRecording(500, 14);
	models::ForecastPipeline pipeline(core::PipelineConfig("LeftArm_Xrotation", {"Spine_Xrotation", "Spine_Yrotation"}));
	pipeline.Train(rec.data.topRows(400), rec.schema);

	const std::string path = TempPath("pipeline.json");
	ModelSerializer::SaveJson(path, ModelSerializer::ToJson(pipeline));
	models::ForecastPipeline loaded = ModelSerializer::PipelineFromJson(ModelSerializer::LoadJson(path));
	std::remove(path.c_str());

	REQUIRE(loaded.IsTrained());
	REQUIRE(loaded.config().target_channel == "LeftArm_Xrotation");

	Eigen::MatrixXd test_data = rec.data.bottomRows(100);
	models::ForecastReport a = pipeline.Forecast(test_data, rec.schema, core::ForecastStrategyKind::DYNAMIC);
	models::ForecastReport b = loaded.Forecast(test_data, rec.schema, core::ForecastStrategyKind::DYNAMIC);
	REQUIRE((a.result.predicted - b.result.predicted).cwiseAbs().maxCoeff() < 1e-9);
}

TEST_CASE("ModelSerializer: movement model document", "[io][movement]") {
	auto channels = models::BodyChannels::Core();
	test::Recording rec = test::SimulateVarRecording(channels, 200, 9);
	models::MovementModel model(channels);
	model.Train(rec.data);

	json doc = ModelSerializer::ToJson(model);
	REQUIRE(doc["variables"].size() == 6);
	REQUIRE(doc["lags"].get<size_t>() == 2);
	REQUIRE(doc["coefficients"]["Hips_Xrotation"].contains("Bias"));
	REQUIRE(doc["pvalues"]["Spine_Zrotation"].contains("Hips_Xrotation(t-1)"));

	models::MovementModel back = ModelSerializer::MovementModelFromJson(doc);
	REQUIRE(back.coefficients() == model.coefficients());
	REQUIRE((back.PredictFromCoefficients(rec.data) - model.in_sample_predictions()).cwiseAbs().maxCoeff() < 1e-12);

	doc["variables"][0] = "Head_Xrotation";
	REQUIRE_THROWS_AS(ModelSerializer::MovementModelFromJson(doc), core::InvalidInputError);
}

TEST_CASE("ModelSerializer: file errors", "[io][errors]") {
	REQUIRE_THROWS_AS(ModelSerializer::LoadJson(TempPath("does_not_exist.json")), core::InvalidInputError);

	const std::string path = TempPath("malformed.json");
	{
		std::ofstream out(path);
		out << "{\"type\": \"arx\", ";
	}
	REQUIRE_THROWS_AS(ModelSerializer::LoadJson(path), core::InvalidInputError);
	std::remove(path.c_str());

	REQUIRE_THROWS_AS(ModelSerializer::ArxModelFromJson(json::array()), core::InvalidInputError);
	REQUIRE_THROWS_AS(ModelSerializer::PipelineFromJson(json::object()), core::InvalidInputError);
}
