#include "tuscan/feature_encoder.hpp"
#include "tuscan/feature_tables.hpp"
#include <cmath>

namespace tuscan {

namespace {

inline int base_index(char c) {
    switch (c) {
        case 'A': return 0;
        case 'C': return 1;
        case 'G': return 2;
        case 'T': return 3;
        default: return -1;
    }
}

// Bit (4*first + second) set when that dinucleotide occurs in the window
uint32_t dinucleotide_mask(const Window& w) {
    uint32_t mask = 0;
    for (size_t i = 0; i + 1 < WINDOW_LENGTH; ++i) {
        const int a = base_index(w[i]);
        const int b = base_index(w[i + 1]);
        if (a < 0 || b < 0) continue;
        mask |= 1u << (a * 4 + b);
    }
    return mask;
}

template <typename Table>
float* encode_presence(const Table& table, uint32_t mask, float* out) {
    for (const auto& d : table) {
        const int bit = base_index(d.first) * 4 + base_index(d.second);
        *out++ = (mask >> bit) & 1u ? 1.0f : 0.0f;
    }
    return out;
}

template <typename Table>
float* encode_positional_bases(const Table& table, const Window& w, float* out) {
    for (const auto& pb : table) {
        *out++ = w[pb.position - 1] == pb.base ? 1.0f : 0.0f;
    }
    return out;
}

template <typename Table>
float* encode_positional_dinucleotides(const Table& table, const Window& w, float* out) {
    for (const auto& pd : table) {
        const size_t i = pd.position - 1;
        *out++ = (w[i] == pd.first && w[i + 1] == pd.second) ? 1.0f : 0.0f;
    }
    return out;
}

float* encode_composition(const Window& w, float* out) {
    size_t counts[4] = {0, 0, 0, 0};
    for (size_t i = 0; i < WINDOW_LENGTH; ++i) {
        const int b = base_index(w[i]);
        if (b >= 0) ++counts[b];
    }
    const double gc = 100.0 * static_cast<double>(counts[1] + counts[2]) /
                      static_cast<double>(WINDOW_LENGTH);
    *out++ = static_cast<float>(std::round(gc * 100.0) / 100.0);
    for (size_t b = 0; b < 4; ++b) {
        *out++ = static_cast<float>(counts[b]);
    }
    return out;
}

template <typename Table>
void append_presence_names(const Table& table, std::vector<std::string>& names) {
    for (const auto& d : table) {
        names.push_back(std::string{d.first, d.second});
    }
}

template <typename Table>
void append_base_names(const Table& table, std::vector<std::string>& names) {
    for (const auto& pb : table) {
        names.push_back(std::string(1, pb.base) + std::to_string(pb.position));
    }
}

template <typename Table>
void append_dinucleotide_names(const Table& table, std::vector<std::string>& names) {
    for (const auto& pd : table) {
        names.push_back(std::string{pd.first, pd.second} + std::to_string(pd.position));
    }
}

}  // namespace

size_t FeatureEncoder::feature_count(ScoringMode mode) {
    return mode == ScoringMode::REGRESSION ? REGRESSION_FEATURE_COUNT
                                           : CLASSIFICATION_FEATURE_COUNT;
}

void FeatureEncoder::encode(const Window& window, float* out) const {
    const uint32_t mask = dinucleotide_mask(window);
    out = encode_composition(window, out);

    if (mode_ == ScoringMode::REGRESSION) {
        using namespace regression_tables;
        out = encode_presence(PRESENT_DINUCLEOTIDES, mask, out);
        out = encode_positional_bases(POSITIONAL_BASES, window, out);
        out = encode_positional_dinucleotides(POSITIONAL_DINUCLEOTIDES, window, out);
        *out = window.view().substr(PAM_TAIL_OFFSET, 4) == PAM_TAIL ? 1.0f : 0.0f;
    } else {
        using namespace classification_tables;
        out = encode_presence(PRESENT_DINUCLEOTIDES, mask, out);
        out = encode_positional_bases(POSITIONAL_BASES, window, out);
        encode_positional_dinucleotides(POSITIONAL_DINUCLEOTIDES, window, out);
    }
}

std::vector<float> FeatureEncoder::encode(const Window& window) const {
    std::vector<float> features(num_features(), 0.0f);
    encode(window, features.data());
    return features;
}

void FeatureEncoder::encode_batch(const std::vector<Candidate>& batch,
                                  FeatureMatrix& matrix) const {
    matrix.resize(batch.size(), num_features());
    for (size_t r = 0; r < batch.size(); ++r) {
        encode(batch[r].window, matrix.row(r));
    }
}

std::vector<std::string> FeatureEncoder::feature_names() const {
    std::vector<std::string> names = {"GC_", "A", "C", "G", "T"};
    names.reserve(num_features());
    if (mode_ == ScoringMode::REGRESSION) {
        using namespace regression_tables;
        append_presence_names(PRESENT_DINUCLEOTIDES, names);
        append_base_names(POSITIONAL_BASES, names);
        append_dinucleotide_names(POSITIONAL_DINUCLEOTIDES, names);
        names.push_back(PAM_TAIL);
    } else {
        using namespace classification_tables;
        append_presence_names(PRESENT_DINUCLEOTIDES, names);
        append_base_names(POSITIONAL_BASES, names);
        append_dinucleotide_names(POSITIONAL_DINUCLEOTIDES, names);
    }
    return names;
}

}  // namespace tuscan
