#pragma once

#include <cstddef>
#include <vector>

namespace tuscan {

// Dense row-major feature matrix, one row per candidate
struct FeatureMatrix {
    size_t rows = 0;
    size_t cols = 0;
    std::vector<float> data;

    FeatureMatrix() = default;
    FeatureMatrix(size_t n_rows, size_t n_cols)
        : rows(n_rows), cols(n_cols), data(n_rows * n_cols, 0.0f) {}

    void resize(size_t n_rows, size_t n_cols) {
        rows = n_rows;
        cols = n_cols;
        data.assign(n_rows * n_cols, 0.0f);
    }

    float* row(size_t r) { return data.data() + r * cols; }
    const float* row(size_t r) const { return data.data() + r * cols; }
};

}  // namespace tuscan
