#include "pch.h"

#include "DemoRisk.Core/typed_column.h"
#include "DemoRisk/anomaly_scoring.h"
#include "DemoRisk/feature_scaler.h"
#include "DemoRisk/isolation_forest.h"
#include "DemoRisk/output_schema.h"
#include "DemoRisk/sampling_engine.h"

#include <algorithm>
#include <cmath>
#include <memory>
#include <numeric>
#include <stdexcept>
#include <vector>

using namespace drisk;

namespace {

// A dense cluster around the origin with one far away point in the last row
Eigen::MatrixXd make_cluster_with_outlier(Eigen::Index inliers) {
    auto data = Eigen::MatrixXd(inliers + 1, 2);
    for (Eigen::Index row = 0; row < inliers; row++) {
        data(row, 0) = 0.01 * static_cast<double>(row % 10);
        data(row, 1) = 0.01 * static_cast<double>(row / 10);
    }

    data(inliers, 0) = 50.0;
    data(inliers, 1) = -50.0;
    return data;
}

} // anonymous namespace

TEST(TestSamplingEngine, SameSeedSameSequence) {
    auto first = SamplingEngine{42};
    auto second = SamplingEngine{42};
    for (auto i = 0; i < 10; i++) {
        ASSERT_EQ(first.next_seed(), second.next_seed());
        ASSERT_EQ(first.next_index(0, 100), second.next_index(0, 100));
        ASSERT_EQ(first.next_uniform(-1.0, 1.0), second.next_uniform(-1.0, 1.0));
    }
}

TEST(TestSamplingEngine, DrawsWithinBounds) {
    auto engine = SamplingEngine{7};
    for (auto i = 0; i < 1000; i++) {
        auto index = engine.next_index(3, 5);
        ASSERT_GE(index, 3u);
        ASSERT_LE(index, 5u);

        auto value = engine.next_uniform(2.0, 4.0);
        ASSERT_GE(value, 2.0);
        ASSERT_LE(value, 4.0);
    }

    ASSERT_EQ(9u, engine.next_index(9, 9));
    ASSERT_THROW(engine.next_index(5, 4), std::invalid_argument);
}

TEST(TestSamplingEngine, SampleFrontKeepsAllValues) {
    auto engine = SamplingEngine{123};
    auto values = std::vector<int>(20);
    std::iota(values.begin(), values.end(), 0);

    engine.sample_front(values, 5);
    auto sorted = values;
    std::sort(sorted.begin(), sorted.end());
    for (auto i = 0; i < 20; i++) {
        ASSERT_EQ(i, sorted[static_cast<std::size_t>(i)]);
    }

    auto empty = std::vector<int>{};
    engine.sample_front(empty, 3);
    ASSERT_TRUE(empty.empty());
}

TEST(TestIsolationForest, AveragePathLength) {
    EXPECT_DOUBLE_EQ(0.0, IsolationForest::average_path_length(0));
    EXPECT_DOUBLE_EQ(0.0, IsolationForest::average_path_length(1));
    EXPECT_DOUBLE_EQ(1.0, IsolationForest::average_path_length(2));
    EXPECT_NEAR(10.244770, IsolationForest::average_path_length(256), 1e-5);
}

TEST(TestIsolationForest, CreateWithParameters) {
    auto params = AnomalyModelParameters{};
    auto model = IsolationForest{params};
    EXPECT_EQ("Isolation Forest", model.name());
    EXPECT_EQ(250u, model.n_estimators());
    EXPECT_EQ(256u, model.max_samples());
    EXPECT_DOUBLE_EQ(0.01, model.contamination());
}

TEST(TestIsolationForest, RejectInvalidParameters) {
    EXPECT_THROW(IsolationForest(0, 256, 0.01), std::invalid_argument);
    EXPECT_THROW(IsolationForest(100, 0, 0.01), std::invalid_argument);
    EXPECT_THROW(IsolationForest(100, 256, 0.0), std::invalid_argument);
    EXPECT_THROW(IsolationForest(100, 256, 0.6), std::invalid_argument);
}

TEST(TestIsolationForest, EmptyDataYieldsEmptyResult) {
    auto model = IsolationForest{10, 16, 0.1};
    auto result = model.detect(Eigen::MatrixXd(0, 4), 42);
    EXPECT_TRUE(result.scores.empty());
    EXPECT_TRUE(result.flags.empty());
}

TEST(TestIsolationForest, SingleRowIsInlier) {
    auto model = IsolationForest{10, 16, 0.1};
    auto data = Eigen::MatrixXd(1, 2);
    data << 1.0, 2.0;
    auto result = model.detect(data, 42);
    ASSERT_EQ(1u, result.scores.size());
    EXPECT_DOUBLE_EQ(-0.5, result.offset);
    EXPECT_DOUBLE_EQ(0.0, result.scores[0]);
    EXPECT_EQ(inlier_flag, result.flags[0]);
}

TEST(TestIsolationForest, FlagsObviousOutlier) {
    auto data = make_cluster_with_outlier(99);
    auto model = IsolationForest{100, 64, 0.01};
    auto result = model.detect(data, 42);
    ASSERT_EQ(100u, result.scores.size());
    ASSERT_EQ(100u, result.flags.size());

    auto lowest = std::min_element(result.scores.cbegin(), result.scores.cend());
    EXPECT_EQ(99, std::distance(result.scores.cbegin(), lowest));
    EXPECT_EQ(outlier_flag, result.flags.back());
}

TEST(TestIsolationForest, FlagsMatchScoreSign) {
    auto data = make_cluster_with_outlier(199);
    auto model = IsolationForest{50, 128, 0.05};
    auto result = model.detect(data, 7);

    auto outliers = 0;
    for (std::size_t i = 0; i < result.scores.size(); i++) {
        EXPECT_EQ(result.scores[i] < 0.0 ? outlier_flag : inlier_flag, result.flags[i]);
        if (result.flags[i] == outlier_flag) {
            outliers++;
        }
    }

    // At most the contamination share, up to ties at the threshold
    EXPECT_GE(outliers, 1);
    EXPECT_LE(outliers, 10);
}

TEST(TestIsolationForest, SameSeedSameScores) {
    auto data = make_cluster_with_outlier(149);
    auto model = IsolationForest{64, 64, 0.02};
    auto first = model.detect(data, 1234);
    auto second = model.detect(data, 1234);
    EXPECT_EQ(first.scores, second.scores);
    EXPECT_EQ(first.flags, second.flags);
    EXPECT_DOUBLE_EQ(first.offset, second.offset);

    auto other = model.detect(data, 4321);
    EXPECT_NE(first.scores, other.scores);
}

TEST(TestIsolationForest, ConstantDataIsNotOutlier) {
    auto data = Eigen::MatrixXd::Constant(20, 3, 5.0);
    auto model = IsolationForest{20, 16, 0.1};
    auto result = model.detect(data, 42);
    for (const auto flag : result.flags) {
        EXPECT_EQ(inlier_flag, flag);
    }
}

TEST(TestStandardScaler, FitTransform) {
    auto data = Eigen::MatrixXd(4, 2);
    data << 1.0, 10.0, 2.0, 10.0, 3.0, 10.0, 4.0, 10.0;

    auto scaler = StandardScaler{};
    auto scaled = scaler.fit_transform(data);
    EXPECT_DOUBLE_EQ(2.5, scaler.mean()(0));
    EXPECT_DOUBLE_EQ(10.0, scaler.mean()(1));
    EXPECT_NEAR(std::sqrt(1.25), scaler.scale()(0), 1e-12);

    // Zero variance columns keep a unit scale
    EXPECT_DOUBLE_EQ(1.0, scaler.scale()(1));
    for (Eigen::Index row = 0; row < scaled.rows(); row++) {
        EXPECT_DOUBLE_EQ(0.0, scaled(row, 1));
    }

    EXPECT_NEAR(0.0, scaled.col(0).mean(), 1e-12);
    EXPECT_NEAR(-1.5 / std::sqrt(1.25), scaled(0, 0), 1e-12);
}

TEST(TestStandardScaler, TransformRequiresFit) {
    auto scaler = StandardScaler{};
    EXPECT_THROW((void)scaler.transform(Eigen::MatrixXd::Zero(2, 2)), std::invalid_argument);

    scaler.fit(Eigen::MatrixXd::Zero(2, 2));
    EXPECT_THROW((void)scaler.transform(Eigen::MatrixXd::Zero(2, 3)), std::invalid_argument);
}

TEST(TestStandardScaler, FeatureMatrixFromTable) {
    auto table = core::DataTable{};
    table.add(std::make_unique<core::DoubleDataTableColumn>("alpha",
                                                            std::vector<double>{1.0, 2.0}));
    table.add(std::make_unique<core::DoubleDataTableColumn>(
        "beta", std::vector<double>{3.0, NAN}, std::vector<bool>{false, false}));

    auto matrix = make_feature_matrix(table, {"beta", "alpha"});
    ASSERT_EQ(2, matrix.rows());
    ASSERT_EQ(2, matrix.cols());
    EXPECT_DOUBLE_EQ(3.0, matrix(0, 0));
    EXPECT_DOUBLE_EQ(0.0, matrix(1, 0));
    EXPECT_DOUBLE_EQ(2.0, matrix(1, 1));
}

TEST(TestAnomalyScoring, AddsFlagAndScoreColumns) {
    auto table = core::DataTable{};
    auto values = std::vector<double>{1.0, 1.1, 0.9, 1.0, 25.0};
    for (const auto &name : columns::model_features) {
        table.add(std::make_unique<core::DoubleDataTableColumn>(name, values));
    }

    auto stage = AnomalyScoring{std::make_unique<IsolationForest>(50, 16, 0.2), 42};
    EXPECT_EQ(ScoringStageType::AnomalyModel, stage.type());
    EXPECT_EQ("Isolation Forest", stage.detector().name());

    stage.apply(table);
    ASSERT_TRUE(table.contains(columns::ml_flag));
    ASSERT_TRUE(table.contains(columns::ml_score));
    const auto &flags = table.column_as<core::IntegerDataTableColumn>(columns::ml_flag);
    EXPECT_EQ(outlier_flag, flags.value_or(4, 0));
}

TEST(TestAnomalyScoring, RejectNullDetector) {
    EXPECT_THROW(AnomalyScoring(nullptr, 42), std::invalid_argument);
}
