// tests/test_forest_model.cpp
//
// Forest file parsing, load-time validation and prediction for both modes.

#include "tuscan/forest_model.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

// Tree 0 splits on feature 0 at 0.5 (leaves 1.0 / 3.0); tree 1 is a single leaf 2.0
const char* REGRESSION_FOREST =
    "tuscan-forest 1\n"
    "# two small trees\n"
    "mode Regression\n"
    "features 3\n"
    "trees 2\n"
    "tree 3\n"
    "0 0.5 1 2 0\n"
    "-1 0 0 0 1.0\n"
    "-1 0 0 0 3.0\n"
    "\n"
    "tree 1\n"
    "-1 0 0 0 2.0\n";

const char* CLASSIFICATION_FOREST =
    "tuscan-forest 1\n"
    "mode Classification\n"
    "features 2\n"
    "trees 2\n"
    "tree 3\n"
    "1 10 1 2 0\n"
    "-1 0 0 0 0.2\n"
    "-1 0 0 0 0.9\n"
    "tree 3\n"
    "1 20 1 2 0\n"
    "-1 0 0 0 0.3\n"
    "-1 0 0 0 0.6\n";

// Two single-leaf trees that disagree: mean probability exactly 0.5
const char* TIED_FOREST =
    "tuscan-forest 1\n"
    "mode Classification\n"
    "features 1\n"
    "trees 2\n"
    "tree 1\n"
    "-1 0 0 0 0.0\n"
    "tree 1\n"
    "-1 0 0 0 1.0\n";

tuscan::ForestModel parse(const std::string& text) {
    std::istringstream in(text);
    return tuscan::ForestModel::parse(in, "test.forest");
}

bool parse_fails(const std::string& text, const std::string& needle) {
    try {
        (void)parse(text);
    } catch (const tuscan::ModelError& e) {
        return std::string(e.what()).find(needle) != std::string::npos;
    }
    return false;
}

int test_parse_regression() {
    std::cout << "Testing regression forest... ";
    int failed = 0;

    auto model = parse(REGRESSION_FOREST);
    expect(model.mode() == tuscan::ScoringMode::REGRESSION, "mode is Regression", failed);
    expect(model.num_features() == 3, "3 features", failed);
    expect(model.num_trees() == 2, "2 trees", failed);

    tuscan::FeatureMatrix m(2, 3);
    m.row(0)[0] = 0.2f;   // left leaf: (1 + 2) / 2
    m.row(1)[0] = 0.5f;   // threshold goes left too
    auto scores = model.predict(m);
    expect(scores.size() == 2, "one score per row", failed);
    expect(std::fabs(scores[0] - 1.5f) < 1e-6f, "row 0 score 1.5", failed);
    expect(std::fabs(scores[1] - 1.5f) < 1e-6f, "x == threshold goes left", failed);

    m.row(1)[0] = 0.6f;   // right leaf: (3 + 2) / 2
    scores = model.predict(m);
    expect(std::fabs(scores[1] - 2.5f) < 1e-6f, "row 1 score 2.5", failed);

    tuscan::FeatureMatrix empty(0, 3);
    expect(model.predict(empty).empty(), "empty matrix gives no scores", failed);

    if (!failed) std::cout << "PASSED\n";
    return failed;
}

int test_parse_classification() {
    std::cout << "Testing classification forest... ";
    int failed = 0;

    auto model = parse(CLASSIFICATION_FOREST);
    expect(model.mode() == tuscan::ScoringMode::CLASSIFICATION, "mode is Classification", failed);

    tuscan::FeatureMatrix m(3, 2);
    m.row(0)[1] = 5.0f;    // (0.2 + 0.3) / 2 = 0.25 -> 0
    m.row(1)[1] = 15.0f;   // (0.9 + 0.3) / 2 = 0.60 -> 1
    m.row(2)[1] = 25.0f;   // (0.9 + 0.6) / 2 = 0.75 -> 1
    auto scores = model.predict(m);
    expect(scores.size() == 3, "three scores", failed);
    if (scores.size() == 3) {
        expect(scores[0] == 0.0f, "low probability is label 0", failed);
        expect(scores[1] == 1.0f, "mean 0.6 is label 1", failed);
        expect(scores[2] == 1.0f, "mean 0.75 is label 1", failed);
    }
    expect(std::fabs(model.mean_leaf_value(m.row(1)) - 0.6f) < 1e-6f, "mean probability 0.6", failed);

    if (!failed) std::cout << "PASSED\n";
    return failed;
}

int test_classification_tie() {
    std::cout << "Testing classification tie... ";
    int failed = 0;

    auto model = parse(TIED_FOREST);
    tuscan::FeatureMatrix m(1, 1);
    expect(std::fabs(model.mean_leaf_value(m.row(0)) - 0.5f) < 1e-6f, "mean probability 0.5", failed);
    auto scores = model.predict(m);
    expect(scores.size() == 1 && scores[0] == 0.0f, "a 0.5 tie is label 0", failed);

    if (!failed) std::cout << "PASSED\n";
    return failed;
}

int test_parse_errors() {
    std::cout << "Testing malformed forests... ";
    int failed = 0;

    expect(parse_fails("", "unexpected end of file"), "empty input", failed);
    expect(parse_fails("random-forest 1\n", "not a tuscan forest"), "bad magic", failed);
    expect(parse_fails("tuscan-forest 2\n", "unsupported forest version"), "bad version", failed);
    expect(parse_fails("tuscan-forest 1\nmode Ranking\n", "mode"), "bad mode", failed);
    expect(parse_fails("tuscan-forest 1\nmode Regression\nfeatures x\n", "features"), "bad count",
           failed);

    // Truncated: tree declares 3 nodes, only 2 present. Line number is reported.
    const std::string truncated =
        "tuscan-forest 1\nmode Regression\nfeatures 1\ntrees 1\ntree 3\n0 0.5 1 2 0\n-1 0 0 0 1\n";
    expect(parse_fails(truncated, "unexpected end of file"), "truncated tree", failed);

    // Child index pointing backwards
    const std::string cycle =
        "tuscan-forest 1\nmode Regression\nfeatures 1\ntrees 1\ntree 2\n0 0.5 0 1 0\n-1 0 0 0 1\n";
    expect(parse_fails(cycle, "invalid child index"), "backward child", failed);

    // Feature index out of range
    const std::string bad_feature =
        "tuscan-forest 1\nmode Regression\nfeatures 1\ntrees 1\ntree 3\n4 0.5 1 2 0\n"
        "-1 0 0 0 1\n-1 0 0 0 2\n";
    expect(parse_fails(bad_feature, "out of range"), "feature out of range", failed);

    expect(parse_fails("tuscan-forest 1\nmode Regression\nfeatures 1\ntrees 0\n", "no trees"),
           "zero trees", failed);

    const std::string bad_node =
        "tuscan-forest 1\nmode Regression\nfeatures 1\ntrees 1\ntree 1\nleaf\n";
    expect(parse_fails(bad_node, "test.forest:6"), "error names file and line", failed);

    if (!failed) std::cout << "PASSED\n";
    return failed;
}

int test_shape_mismatch() {
    std::cout << "Testing shape mismatch... ";
    int failed = 0;

    auto model = parse(REGRESSION_FOREST);
    tuscan::FeatureMatrix wrong(2, 4);
    bool threw = false;
    try {
        (void)model.predict(wrong);
    } catch (const tuscan::ModelError&) {
        threw = true;
    }
    expect(threw, "predict rejects a matrix with the wrong column count", failed);

    threw = false;
    try {
        (void)tuscan::ForestModel::load("/nonexistent/dir/model.forest");
    } catch (const tuscan::ModelError&) {
        threw = true;
    }
    expect(threw, "missing model file raises ModelError", failed);

    if (!failed) std::cout << "PASSED\n";
    return failed;
}

int test_default_path() {
    std::cout << "Testing default model path... ";
    int failed = 0;

    setenv("TUSCAN_MODEL_DIR", "/opt/tuscan/models", 1);
    expect(tuscan::default_model_path(tuscan::ScoringMode::REGRESSION) ==
               "/opt/tuscan/models/rf_regression.forest",
           "regression path from TUSCAN_MODEL_DIR", failed);
    expect(tuscan::default_model_path(tuscan::ScoringMode::CLASSIFICATION) ==
               "/opt/tuscan/models/rf_classification.forest",
           "classification path from TUSCAN_MODEL_DIR", failed);
    unsetenv("TUSCAN_MODEL_DIR");
    expect(tuscan::default_model_path(tuscan::ScoringMode::REGRESSION) == "./rf_regression.forest",
           "current directory when unset", failed);

    if (!failed) std::cout << "PASSED\n";
    return failed;
}

}  // namespace

int main() {
    std::cout << "\n=== Forest Model Tests ===\n\n";
    int total = 0;
    total += test_parse_regression();
    total += test_parse_classification();
    total += test_classification_tie();
    total += test_parse_errors();
    total += test_shape_mismatch();
    total += test_default_path();

    if (total == 0) {
        std::cout << "\nAll tests passed!\n";
        return 0;
    }
    std::cerr << "\n" << total << " check(s) FAILED.\n";
    return 1;
}
