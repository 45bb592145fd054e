#pragma once

/**
 * @file forest_model.hpp
 * @brief Read-only scoring models for candidate feature matrices
 *
 * A ScoringModel is loaded once before scanning and handed to the pipeline
 * by const reference; predict() must be safe to call from many threads.
 *
 * ForestModel file format (text, whitespace separated, '#' comments):
 *
 *   tuscan-forest 1
 *   mode Regression|Classification
 *   features <n>
 *   trees <t>
 *   tree <nodes>
 *   <feature> <threshold> <left> <right> <value>     (one line per node)
 *   ...
 *
 * Node 0 is the root. feature == -1 marks a leaf; for leaves the value is the
 * regression output (Regression) or the positive-class probability
 * (Classification). Internal nodes send x[feature] <= threshold to `left`.
 */

#include "tuscan/feature_matrix.hpp"
#include "tuscan/types.hpp"
#include <cstdint>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace tuscan {

class ModelError : public std::runtime_error {
public:
    explicit ModelError(const std::string& msg) : std::runtime_error(msg) {}
};

class ScoringModel {
public:
    virtual ~ScoringModel() = default;

    // One score per matrix row, in row order. Throws ModelError on shape mismatch.
    virtual std::vector<float> predict(const FeatureMatrix& features) const = 0;

    virtual size_t num_features() const = 0;
    virtual ScoringMode mode() const = 0;
};

class ForestModel : public ScoringModel {
public:
    struct Node {
        int32_t feature;    // -1 = leaf
        float threshold;
        int32_t left;
        int32_t right;
        float value;
    };

    using Tree = std::vector<Node>;

    ForestModel(ScoringMode mode, size_t num_features, std::vector<Tree> trees);

    static ForestModel load(const std::string& path);
    static ForestModel parse(std::istream& in, const std::string& source_name);

    std::vector<float> predict(const FeatureMatrix& features) const override;
    size_t num_features() const override { return num_features_; }
    ScoringMode mode() const override { return mode_; }

    size_t num_trees() const { return trees_.size(); }

    // Mean leaf value over all trees for a single row
    float mean_leaf_value(const float* row) const;

private:
    ScoringMode mode_;
    size_t num_features_;
    std::vector<Tree> trees_;
};

// Default model location: $TUSCAN_MODEL_DIR/rf_<mode>.forest (or ./ when unset)
std::string default_model_path(ScoringMode mode);

}  // namespace tuscan
