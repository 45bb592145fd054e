#include "tuscan/forest_model.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace tuscan {

namespace {

// Line-oriented tokenizer that skips blanks and '#' comments
class ModelLineReader {
public:
    ModelLineReader(std::istream& in, const std::string& source)
        : in_(in), source_(source) {}

    bool next(std::istringstream& fields) {
        std::string line;
        while (std::getline(in_, line)) {
            ++line_no_;
            const size_t hash = line.find('#');
            if (hash != std::string::npos) line.resize(hash);
            if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
            fields.clear();
            fields.str(line);
            return true;
        }
        return false;
    }

    void require(std::istringstream& fields, const char* what) {
        if (!next(fields)) {
            fail(std::string("unexpected end of file, expected ") + what);
        }
    }

    [[noreturn]] void fail(const std::string& msg) const {
        throw ModelError(source_ + ":" + std::to_string(line_no_) + ": " + msg);
    }

private:
    std::istream& in_;
    std::string source_;
    size_t line_no_ = 0;
};

size_t expect_keyword_count(ModelLineReader& reader, std::istringstream& fields,
                            const std::string& keyword) {
    reader.require(fields, keyword.c_str());
    std::string key;
    long long value = -1;
    if (!(fields >> key >> value) || key != keyword || value < 0) {
        reader.fail("expected '" + keyword + " <count>'");
    }
    return static_cast<size_t>(value);
}

}  // namespace

ForestModel::ForestModel(ScoringMode mode, size_t num_features, std::vector<Tree> trees)
    : mode_(mode), num_features_(num_features), trees_(std::move(trees)) {
    if (trees_.empty()) {
        throw ModelError("Forest has no trees");
    }
    for (size_t t = 0; t < trees_.size(); ++t) {
        const Tree& tree = trees_[t];
        if (tree.empty()) {
            throw ModelError("Tree " + std::to_string(t) + " has no nodes");
        }
        const int32_t n = static_cast<int32_t>(tree.size());
        for (int32_t i = 0; i < n; ++i) {
            const Node& node = tree[i];
            if (node.feature < 0) continue;
            if (static_cast<size_t>(node.feature) >= num_features_) {
                throw ModelError("Tree " + std::to_string(t) + " node " + std::to_string(i) +
                                 ": feature " + std::to_string(node.feature) +
                                 " out of range (model has " + std::to_string(num_features_) + ")");
            }
            // Children always follow their parent, which also rules out cycles
            if (node.left <= i || node.left >= n || node.right <= i || node.right >= n) {
                throw ModelError("Tree " + std::to_string(t) + " node " + std::to_string(i) +
                                 ": invalid child index");
            }
        }
    }
}

ForestModel ForestModel::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ModelError("Cannot open model file: " + path);
    }
    return parse(in, path);
}

ForestModel ForestModel::parse(std::istream& in, const std::string& source_name) {
    ModelLineReader reader(in, source_name);
    std::istringstream fields;

    reader.require(fields, "header");
    std::string magic;
    int version = 0;
    if (!(fields >> magic >> version) || magic != "tuscan-forest") {
        reader.fail("not a tuscan forest file");
    }
    if (version != 1) {
        reader.fail("unsupported forest version " + std::to_string(version));
    }

    reader.require(fields, "mode");
    std::string key, mode_str;
    ScoringMode mode = ScoringMode::REGRESSION;
    if (!(fields >> key >> mode_str) || key != "mode" || !parse_scoring_mode(mode_str, mode)) {
        reader.fail("expected 'mode Regression|Classification'");
    }

    const size_t n_features = expect_keyword_count(reader, fields, "features");
    const size_t n_trees = expect_keyword_count(reader, fields, "trees");

    std::vector<Tree> trees;
    trees.reserve(n_trees);
    for (size_t t = 0; t < n_trees; ++t) {
        const size_t n_nodes = expect_keyword_count(reader, fields, "tree");
        Tree tree;
        tree.reserve(n_nodes);
        for (size_t i = 0; i < n_nodes; ++i) {
            reader.require(fields, "tree node");
            Node node{};
            if (!(fields >> node.feature >> node.threshold >> node.left >> node.right >> node.value)) {
                reader.fail("expected '<feature> <threshold> <left> <right> <value>'");
            }
            tree.push_back(node);
        }
        trees.push_back(std::move(tree));
    }

    try {
        return ForestModel(mode, n_features, std::move(trees));
    } catch (const ModelError& e) {
        throw ModelError(source_name + ": " + e.what());
    }
}

float ForestModel::mean_leaf_value(const float* row) const {
    double sum = 0.0;
    for (const Tree& tree : trees_) {
        int32_t idx = 0;
        while (tree[idx].feature >= 0) {
            const Node& node = tree[idx];
            idx = row[node.feature] <= node.threshold ? node.left : node.right;
        }
        sum += tree[idx].value;
    }
    return static_cast<float>(sum / static_cast<double>(trees_.size()));
}

std::vector<float> ForestModel::predict(const FeatureMatrix& features) const {
    if (features.cols != num_features_) {
        throw ModelError("Feature matrix has " + std::to_string(features.cols) +
                         " columns, model expects " + std::to_string(num_features_));
    }
    if (features.data.size() != features.rows * features.cols) {
        throw ModelError("Feature matrix storage does not match its shape");
    }

    std::vector<float> scores(features.rows);
    for (size_t r = 0; r < features.rows; ++r) {
        const float mean = mean_leaf_value(features.row(r));
        if (mode_ == ScoringMode::CLASSIFICATION) {
            // A 0.5 tie goes to class 0
            scores[r] = mean > 0.5f ? 1.0f : 0.0f;
        } else {
            scores[r] = mean;
        }
    }
    return scores;
}

std::string default_model_path(ScoringMode mode) {
    const char* dir = std::getenv("TUSCAN_MODEL_DIR");
    std::string base = (dir && *dir) ? std::string(dir) : std::string(".");
    if (base.back() != '/') base += '/';
    return base + (mode == ScoringMode::REGRESSION ? "rf_regression.forest"
                                                    : "rf_classification.forest");
}

}  // namespace tuscan
