// tests/test_motif_scanner.cpp
//
// Candidate discovery on a single strand:
//   - anchor placement and window contents
//   - trailing context requirement (30-nt footprint, 28-nt window)
//   - non-ACGT characters inside / outside the footprint
//   - overlapping anchors (GGG) and early stop
//   - reverse-complement involution and reverse-strand hits

#include "tuscan/motif_scanner.hpp"
#include "tuscan/sequence_io.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

std::string repeat(char c, size_t n) { return std::string(n, c); }

int test_single_anchor() {
    std::cout << "Testing single anchor... ";
    int failed = 0;

    const std::string seq = repeat('A', 28) + "GG" + repeat('A', 10);
    auto hits = tuscan::MotifScanner::find_all(seq, tuscan::Strand::FORWARD);
    expect(hits.size() == 1, "expected exactly one hit, got " + std::to_string(hits.size()), failed);
    if (hits.size() == 1) {
        expect(hits[0].offset == 3, "hit offset should be 3", failed);
        expect(hits[0].strand == tuscan::Strand::FORWARD, "hit should be forward", failed);
        expect(hits[0].window.str() == repeat('A', 25) + "GGA",
               "window should be 25 A + GGA, got " + hits[0].window.str(), failed);
    }

    if (!failed) std::cout << "PASSED\n";
    return failed;
}

int test_trailing_context() {
    std::cout << "Testing trailing context... ";
    int failed = 0;

    // Two trailing nucleotides: 29 nt total, no room for the footprint
    const std::string short_seq = repeat('C', 25) + "GG" + "AA";
    expect(tuscan::MotifScanner::find_all(short_seq, tuscan::Strand::FORWARD).empty(),
           "29-nt sequence must not match", failed);

    const std::string exact = repeat('C', 25) + "GG" + "AAT";
    auto hits = tuscan::MotifScanner::find_all(exact, tuscan::Strand::FORWARD);
    expect(hits.size() == 1, "30-nt sequence must match once", failed);
    if (!hits.empty()) {
        expect(hits[0].window.str() == repeat('C', 25) + "GGA", "window drops the last two context nt",
               failed);
    }

    // Anchor too close to the start: GG at 24..25
    const std::string early = repeat('T', 24) + "GG" + repeat('T', 10);
    expect(tuscan::MotifScanner::find_all(early, tuscan::Strand::FORWARD).empty(),
           "GG before position 25 must not match", failed);

    expect(tuscan::MotifScanner::find_all("", tuscan::Strand::FORWARD).empty(),
           "empty sequence has no hits", failed);

    if (!failed) std::cout << "PASSED\n";
    return failed;
}

int test_invalid_characters() {
    std::cout << "Testing invalid characters... ";
    int failed = 0;

    // N in the trailing context
    const std::string n_tail = repeat('A', 25) + "GG" + "ANA";
    expect(tuscan::MotifScanner::find_all(n_tail, tuscan::Strand::FORWARD).empty(),
           "N in trailing context must block the match", failed);

    // N in the core
    std::string n_core = repeat('A', 25) + "GG" + "AAA";
    n_core[10] = 'N';
    expect(tuscan::MotifScanner::find_all(n_core, tuscan::Strand::FORWARD).empty(),
           "N in core must block the match", failed);

    // N just before the footprint does not matter
    const std::string n_before = "N" + repeat('A', 25) + "GG" + "AAA";
    auto hits = tuscan::MotifScanner::find_all(n_before, tuscan::Strand::FORWARD);
    expect(hits.size() == 1 && hits[0].offset == 1, "N outside the footprint is ignored", failed);

    // N far upstream, then a long clean stretch
    const std::string n_far = "NNNN" + repeat('C', 40) + "GG" + "TTT";
    hits = tuscan::MotifScanner::find_all(n_far, tuscan::Strand::FORWARD);
    expect(hits.size() == 1 && hits[0].offset == 19, "hit after an N run at offset 19", failed);

    // Lowercase is not normalised by the scanner
    const std::string lower = repeat('a', 25) + "gg" + "aaa";
    expect(tuscan::MotifScanner::find_all(lower, tuscan::Strand::FORWARD).empty(),
           "lowercase input never matches", failed);

    expect(!tuscan::MotifScanner::matches_at(n_tail, 0), "matches_at rejects N", failed);
    expect(tuscan::MotifScanner::matches_at(n_before, 1), "matches_at accepts offset 1", failed);
    expect(!tuscan::MotifScanner::matches_at(n_before, 2), "matches_at past the end", failed);

    if (!failed) std::cout << "PASSED\n";
    return failed;
}

int test_overlapping_anchors() {
    std::cout << "Testing overlapping anchors... ";
    int failed = 0;

    // GGG gives two anchors one nucleotide apart
    const std::string seq = repeat('A', 25) + "GGG" + "AAA";
    auto hits = tuscan::MotifScanner::find_all(seq, tuscan::Strand::FORWARD);
    expect(hits.size() == 2, "GGG should yield two hits, got " + std::to_string(hits.size()), failed);
    if (hits.size() == 2) {
        expect(hits[0].offset == 0 && hits[1].offset == 1, "hits in ascending offset order", failed);
        expect(hits[1].window.str() == repeat('A', 24) + "GGGA", "second window", failed);
    }

    // Second anchor five nucleotides downstream, sharing most of the window
    const std::string spaced = repeat('A', 25) + "GG" + "AAA" + "GG" + "AAA";
    hits = tuscan::MotifScanner::find_all(spaced, tuscan::Strand::FORWARD);
    expect(hits.size() == 2, "anchors at 25 and 30 both match", failed);
    if (hits.size() == 2) {
        expect(hits[0].offset == 0 && hits[1].offset == 5, "offsets 0 and 5", failed);
        expect(hits[1].window.str() == repeat('A', 20) + "GGAAAGGA", "window of the second hit", failed);
    }

    // Early stop after the first hit
    size_t seen = 0;
    size_t delivered = tuscan::MotifScanner::scan(seq, tuscan::Strand::FORWARD,
                                                  [&seen](const tuscan::Candidate&) {
                                                      ++seen;
                                                      return false;
                                                  });
    expect(seen == 1 && delivered == 1, "callback returning false stops the scan", failed);

    if (!failed) std::cout << "PASSED\n";
    return failed;
}

int test_reverse_strand() {
    std::cout << "Testing reverse strand... ";
    int failed = 0;

    const std::string seq = "ACGTNacgtRYK" + repeat('T', 10) + "CC" + repeat('T', 28);
    const std::string rc = tuscan::SequenceUtils::reverse_complement(seq);
    expect(tuscan::SequenceUtils::reverse_complement(rc) == seq, "reverse complement is an involution",
           failed);

    const std::string fwd = repeat('T', 10) + "CC" + repeat('T', 28);
    expect(tuscan::MotifScanner::find_all(fwd, tuscan::Strand::FORWARD).empty(),
           "no forward anchor", failed);

    auto hits = tuscan::MotifScanner::find_all(tuscan::SequenceUtils::reverse_complement(fwd),
                                               tuscan::Strand::REVERSE);
    expect(hits.size() == 1, "one reverse hit", failed);
    if (!hits.empty()) {
        expect(hits[0].offset == 3, "reverse hit offset 3", failed);
        expect(hits[0].strand == tuscan::Strand::REVERSE, "hit tagged reverse", failed);
    }

    if (!failed) std::cout << "PASSED\n";
    return failed;
}

}  // namespace

int main() {
    std::cout << "\n=== Motif Scanner Tests ===\n\n";
    int total = 0;
    total += test_single_anchor();
    total += test_trailing_context();
    total += test_invalid_characters();
    total += test_overlapping_anchors();
    total += test_reverse_strand();

    if (total == 0) {
        std::cout << "\nAll tests passed!\n";
        return 0;
    }
    std::cerr << "\n" << total << " check(s) FAILED.\n";
    return 1;
}
