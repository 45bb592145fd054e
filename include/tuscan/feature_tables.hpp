#pragma once

/**
 * @file feature_tables.hpp
 * @brief Positional feature tables of the trained TUSCAN forests
 *
 * The column order of every table is the column order the forests were
 * trained on. Reordering or editing an entry changes predictions silently.
 *
 * Positions are 1-based within the 28-nt candidate window:
 *   1-4    upstream flank
 *   5-24   protospacer
 *   25     N of the NGG PAM
 *   26-27  GG anchor
 *   28     first downstream nucleotide
 *
 * Naming follows the feature matrix header: "C7" is a C at position 7,
 * "CT7" is C at 7 and T at 8.
 */

#include <array>
#include <cstddef>
#include <cstdint>

namespace tuscan {

struct PositionalBase {
    char base;
    uint8_t position;
};

struct PositionalDinucleotide {
    char first;
    char second;
    uint8_t position;
};

struct Dinucleotide {
    char first;
    char second;
};

namespace regression_tables {

constexpr std::array<Dinucleotide, 6> PRESENT_DINUCLEOTIDES = {{
    {'C', 'A'}, {'C', 'T'}, {'G', 'C'}, {'T', 'C'}, {'T', 'G'}, {'T', 'T'}
}};

constexpr std::array<PositionalBase, 13> POSITIONAL_BASES = {{
    {'A', 4},  {'C', 5},  {'T', 8},  {'G', 12}, {'A', 15}, {'C', 16}, {'T', 17},
    {'G', 20}, {'C', 21}, {'G', 22}, {'T', 23}, {'A', 24}, {'C', 25}
}};

constexpr std::array<PositionalDinucleotide, 37> POSITIONAL_DINUCLEOTIDES = {{
    {'A', 'G', 1},  {'C', 'T', 2},  {'G', 'T', 3},  {'A', 'A', 3},  {'C', 'A', 4},
    {'T', 'T', 4},  {'T', 'C', 5},  {'A', 'G', 6},  {'G', 'C', 6},  {'C', 'C', 7},
    {'T', 'T', 8},  {'G', 'A', 9},  {'A', 'T', 9},  {'A', 'C', 10}, {'C', 'G', 11},
    {'T', 'G', 12}, {'C', 'A', 12}, {'G', 'G', 13}, {'C', 'T', 14}, {'A', 'T', 15},
    {'T', 'A', 15}, {'G', 'C', 16}, {'T', 'A', 17}, {'G', 'G', 17}, {'C', 'A', 18},
    {'A', 'G', 19}, {'C', 'C', 19}, {'G', 'T', 20}, {'C', 'C', 21}, {'A', 'C', 21},
    {'T', 'C', 22}, {'G', 'A', 23}, {'T', 'T', 23}, {'C', 'G', 24}, {'T', 'G', 25},
    {'G', 'A', 27}, {'G', 'T', 27}
}};

// window[24..27] == "TGGT"
constexpr char PAM_TAIL[] = "TGGT";
constexpr size_t PAM_TAIL_OFFSET = 24;

}  // namespace regression_tables

namespace classification_tables {

// All 16 dinucleotides, AA..TT
constexpr std::array<Dinucleotide, 16> PRESENT_DINUCLEOTIDES = {{
    {'A', 'A'}, {'A', 'C'}, {'A', 'G'}, {'A', 'T'},
    {'C', 'A'}, {'C', 'C'}, {'C', 'G'}, {'C', 'T'},
    {'G', 'A'}, {'G', 'C'}, {'G', 'G'}, {'G', 'T'},
    {'T', 'A'}, {'T', 'C'}, {'T', 'G'}, {'T', 'T'}
}};

constexpr std::array<PositionalBase, 12> POSITIONAL_BASES = {{
    {'G', 2},  {'A', 5},  {'C', 8},  {'T', 10}, {'G', 14}, {'A', 16},
    {'C', 18}, {'T', 20}, {'G', 21}, {'C', 23}, {'T', 24}, {'G', 25}
}};

constexpr std::array<PositionalDinucleotide, 13> POSITIONAL_DINUCLEOTIDES = {{
    {'C', 'T', 3},  {'A', 'G', 5},  {'G', 'A', 7},  {'T', 'C', 9},  {'C', 'C', 11},
    {'A', 'T', 13}, {'G', 'T', 15}, {'T', 'G', 17}, {'C', 'A', 19}, {'A', 'C', 20},
    {'G', 'C', 22}, {'T', 'T', 23}, {'C', 'G', 24}
}};

}  // namespace classification_tables

// GC% + counts of A, C, G, T
constexpr size_t COMPOSITION_FEATURES = 5;

constexpr size_t REGRESSION_FEATURE_COUNT =
    COMPOSITION_FEATURES +
    regression_tables::PRESENT_DINUCLEOTIDES.size() +
    regression_tables::POSITIONAL_BASES.size() +
    regression_tables::POSITIONAL_DINUCLEOTIDES.size() +
    1;  // PAM tail

constexpr size_t CLASSIFICATION_FEATURE_COUNT =
    COMPOSITION_FEATURES +
    classification_tables::PRESENT_DINUCLEOTIDES.size() +
    classification_tables::POSITIONAL_BASES.size() +
    classification_tables::POSITIONAL_DINUCLEOTIDES.size();

static_assert(REGRESSION_FEATURE_COUNT == 62, "regression layout changed");
static_assert(CLASSIFICATION_FEATURE_COUNT == 46, "classification layout changed");

}  // namespace tuscan
