// tests/test_end_to_end.cpp
//
// Full scan of small targets: scanner -> pipeline -> collector, forward pass
// then reverse-complement pass, reference coordinates on both strands, the
// column report, and pre-cut 30-mer validation for `tuscan score`.

#include "tuscan/forest_model.hpp"
#include "tuscan/guide_reader.hpp"
#include "tuscan/orchestrator.hpp"
#include "tuscan/report_writer.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <zlib.h>

namespace fs = std::filesystem;

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

std::string repeat(char c, size_t n) { return std::string(n, c); }

// Single-leaf regression forest: every site scores 0.5
tuscan::ForestModel constant_model() {
    tuscan::ForestModel::Tree tree = {{-1, 0.0f, 0, 0, 0.5f}};
    return tuscan::ForestModel(tuscan::ScoringMode::REGRESSION,
                               tuscan::FeatureEncoder::feature_count(tuscan::ScoringMode::REGRESSION),
                               {tree});
}

tuscan::ScanTarget make_target(const std::string& chrom, uint64_t start, const std::string& seq) {
    tuscan::ScanTarget t;
    t.region.chrom = chrom;
    t.region.start = start;
    t.region.end = start + seq.size();
    t.sequence = seq;
    return t;
}

struct Harness {
    tuscan::ForestModel model = constant_model();
    tuscan::FeatureEncoder encoder{tuscan::ScoringMode::REGRESSION};
    tuscan::ScoringPipeline pipeline;
    tuscan::Orchestrator orchestrator;

    explicit Harness(size_t workers)
        : pipeline(model, encoder, tuscan::PipelineConfig{workers, tuscan::DEFAULT_BATCH_SIZE}),
          orchestrator(pipeline, false) {}

    std::vector<tuscan::ScoredCandidate> run(const tuscan::ScanTarget& target,
                                             tuscan::TargetStats* stats = nullptr) {
        std::vector<tuscan::ScoredCandidate> out;
        auto s = orchestrator.run(target, [&out](const tuscan::ScoredCandidate& r) { out.push_back(r); });
        if (stats) *stats = s;
        return out;
    }
};

int test_forward_site() {
    std::cout << "Testing forward site coordinates... ";
    int failed = 0;

    Harness h(2);
    tuscan::TargetStats stats;
    auto records = h.run(make_target("chr1", 0, repeat('A', 28) + "GG" + repeat('A', 10)), &stats);

    expect(records.size() == 1, "one record, got " + std::to_string(records.size()), failed);
    if (records.size() == 1) {
        const auto& r = records[0];
        expect(r.chrom == "chr1", "chrom", failed);
        expect(r.strand == tuscan::Strand::FORWARD, "strand +", failed);
        expect(r.start == 8 && r.end == 30,
               "span 8-30, got " + std::to_string(r.start) + "-" + std::to_string(r.end), failed);
        expect(r.window.str() == repeat('A', 25) + "GGA", "window", failed);
        expect(r.score == 0.5f, "constant model score", failed);
    }
    expect(stats.forward.state == tuscan::PassState::DONE, "forward pass DONE", failed);
    expect(stats.reverse.state == tuscan::PassState::DONE, "reverse pass DONE", failed);
    expect(stats.forward.candidates == 1 && stats.reverse.candidates == 0, "candidate counts", failed);

    if (!failed) std::cout << "PASSED\n";
    return failed;
}

int test_reverse_site() {
    std::cout << "Testing reverse site coordinates... ";
    int failed = 0;

    Harness h(3);
    auto records = h.run(make_target("chr2", 100, repeat('T', 10) + "CC" + repeat('T', 28)));

    expect(records.size() == 1, "one record", failed);
    if (records.size() == 1) {
        const auto& r = records[0];
        expect(r.strand == tuscan::Strand::REVERSE, "strand -", failed);
        // CCN PAM at 111-113, protospacer 114-133 (1-based, forward reference)
        expect(r.start == 111 && r.end == 133,
               "span 111-133, got " + std::to_string(r.start) + "-" + std::to_string(r.end), failed);
        expect(r.window.str() == repeat('A', 25) + "GGA", "window read on the reverse strand", failed);
    }

    if (!failed) std::cout << "PASSED\n";
    return failed;
}

int test_strand_order() {
    std::cout << "Testing forward pass completes before reverse pass... ";
    int failed = 0;

    Harness h(4);
    const std::string seq = repeat('A', 28) + "GG" + repeat('A', 10) +
                            repeat('T', 10) + "CC" + repeat('T', 28);
    auto records = h.run(make_target("chr3", 0, seq));

    expect(records.size() == 2, "two records", failed);
    if (records.size() == 2) {
        expect(records[0].strand == tuscan::Strand::FORWARD, "forward first", failed);
        expect(records[1].strand == tuscan::Strand::REVERSE, "reverse second", failed);
        expect(records[0].start == 8 && records[1].start == 51 && records[1].end == 73,
               "both spans on the forward reference", failed);
    }

    // No candidates at all: N-masked and too short
    auto none = h.run(make_target("chr4", 0, repeat('N', 50)));
    expect(none.empty(), "N-only target yields nothing", failed);
    none = h.run(make_target("chr4", 0, "ACGGT"));
    expect(none.empty(), "short target yields nothing", failed);

    if (!failed) std::cout << "PASSED\n";
    return failed;
}

int test_region_mismatch() {
    std::cout << "Testing region/sequence length mismatch... ";
    int failed = 0;

    Harness h(1);
    tuscan::ScanTarget bad = make_target("chr1", 0, repeat('A', 40));
    bad.region.end = 39;
    bool threw = false;
    try {
        (void)h.run(bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expect(threw, "mismatched region rejected", failed);

    if (!failed) std::cout << "PASSED\n";
    return failed;
}

int test_report() {
    std::cout << "Testing scan report... ";
    int failed = 0;

    const fs::path out = fs::temp_directory_path() / "tuscan_test_end_to_end_report.txt";
    {
        Harness h(2);
        tuscan::ReportWriter report(out.string(), tuscan::ReportWriter::Layout::SCAN);
        report.write_header();
        h.orchestrator.run(make_target("chr1", 0, repeat('A', 28) + "GG" + repeat('A', 10)),
                           [&report](const tuscan::ScoredCandidate& r) { report.write_site(r); });
        expect(report.rows_written() == 1, "one row written", failed);
        report.close();
    }

    std::ifstream in(out);
    std::string header, row, extra;
    std::getline(in, header);
    std::getline(in, row);
    expect(header.rfind("Chromosome", 0) == 0, "header starts with Chromosome", failed);
    expect(header.find("Score") != std::string::npos, "header has Score", failed);

    std::istringstream fields(row);
    std::string chrom, strand, seq;
    uint64_t start = 0, end = 0;
    double score = 0.0;
    fields >> chrom >> start >> end >> strand >> seq >> score;
    expect(chrom == "chr1" && start == 8 && end == 30 && strand == "+", "row coordinates", failed);
    expect(seq == repeat('A', 25) + "GGA", "row sequence", failed);
    expect(score == 0.5, "row score", failed);
    expect(!std::getline(in, extra), "no extra rows", failed);

    in.close();
    fs::remove(out);
    if (!failed) std::cout << "PASSED\n";
    return failed;
}

int test_guides() {
    std::cout << "Testing pre-cut 30-mer validation... ";
    int failed = 0;

    std::string oriented;
    tuscan::Strand dir = tuscan::Strand::FORWARD;
    const std::string fwd = repeat('A', 25) + "GG" + "ACT";
    expect(tuscan::check_guide(fwd, oriented, dir) == tuscan::GuideCheck::OK, "forward 30-mer ok", failed);
    expect(oriented == fwd && dir == tuscan::Strand::FORWARD, "forward kept as is", failed);

    const std::string rev = "AGT" + std::string("CC") + repeat('T', 25);
    expect(tuscan::check_guide(rev, oriented, dir) == tuscan::GuideCheck::OK, "reverse 30-mer ok", failed);
    expect(oriented == fwd && dir == tuscan::Strand::REVERSE, "reverse reoriented", failed);

    expect(tuscan::check_guide(repeat('a', 25) + "ggact", oriented, dir) == tuscan::GuideCheck::OK,
           "lowercase accepted", failed);
    expect(tuscan::check_guide(repeat('A', 25) + "GGNCT", oriented, dir) ==
               tuscan::GuideCheck::INVALID_NUCLEOTIDE, "N rejected", failed);
    expect(tuscan::check_guide(repeat('A', 25) + "GGAC", oriented, dir) == tuscan::GuideCheck::BAD_LENGTH,
           "29-mer rejected", failed);
    expect(tuscan::check_guide(repeat('A', 30), oriented, dir) == tuscan::GuideCheck::NO_PAM,
           "no PAM rejected", failed);

    const fs::path path = fs::temp_directory_path() / "tuscan_test_end_to_end_guides.txt";
    {
        std::ofstream f(path);
        f << fwd << "\n" << rev << "\n" << "ACGT\n" << "\n" << repeat('A', 30) << "\n";
    }
    std::vector<std::string> warnings;
    size_t rejected = 0;
    auto guides = tuscan::read_guides(path.string(),
                                      [&](tuscan::GuideCheck check, const std::string& msg) {
                                          warnings.push_back(msg);
                                          if (check != tuscan::GuideCheck::OK) ++rejected;
                                      });
    expect(guides.size() == 2, "two valid guides", failed);
    if (guides.size() == 2) {
        expect(guides[0].id == "1" && guides[1].id == "2", "ids are line numbers", failed);
        expect(guides[1].dir == tuscan::Strand::REVERSE, "second guide reverse", failed);
    }
    expect(rejected == 2 && warnings.size() == 3, "two rejections plus one reorientation", failed);
    if (warnings.size() == 3) {
        expect(warnings[1].find("line 3 is not 30 base pairs, it is 4") != std::string::npos,
               "length message names the line", failed);
        expect(warnings[2].find("line 5 does not have a PAM motif") != std::string::npos,
               "PAM message names the line", failed);
    }

    fs::remove(path);
    if (!failed) std::cout << "PASSED\n";
    return failed;
}

bool write_gzip(const fs::path& path, const std::string& text) {
    gzFile out = gzopen(path.string().c_str(), "wb");
    if (!out) return false;
    const int n = gzwrite(out, text.data(), static_cast<unsigned>(text.size()));
    return gzclose(out) == Z_OK && n == static_cast<int>(text.size());
}

int test_gzipped_guides() {
    std::cout << "Testing gzipped guide inputs... ";
    int failed = 0;

    const std::string fwd = repeat('A', 25) + "GG" + "ACT";
    const std::string rev = "AGT" + std::string("CC") + repeat('T', 25);

    // One 30-mer per line, compressed
    const fs::path list = fs::temp_directory_path() / "tuscan_test_end_to_end_guides.txt.gz";
    expect(write_gzip(list, fwd + "\n" + rev + "\n"), "write gzip list", failed);
    size_t warned = 0;
    auto guides = tuscan::read_guides(list.string(),
                                      [&warned](tuscan::GuideCheck, const std::string&) { ++warned; });
    expect(guides.size() == 2, "gzip line list gives two guides", failed);
    if (guides.size() == 2) {
        expect(guides[0].id == "1" && guides[0].sequence == fwd, "first guide from line 1", failed);
        expect(guides[1].id == "2" && guides[1].dir == tuscan::Strand::REVERSE, "second guide reversed",
               failed);
    }
    expect(warned == 1, "only the reorientation is reported", failed);

    // Compressed FASTA keeps record ids
    const fs::path fasta = fs::temp_directory_path() / "tuscan_test_end_to_end_guides.fa.gz";
    expect(write_gzip(fasta, "\n>g1 first\n" + fwd.substr(0, 15) + "\n" + fwd.substr(15) + "\n"),
           "write gzip FASTA", failed);
    guides = tuscan::read_guides(fasta.string(), nullptr);
    expect(guides.size() == 1 && guides[0].id == "g1" && guides[0].sequence == fwd,
           "gzip FASTA record g1", failed);

    fs::remove(list);
    fs::remove(fasta);
    if (!failed) std::cout << "PASSED\n";
    return failed;
}

}  // namespace

int main() {
    std::cout << "\n=== End-to-End Scan Tests ===\n\n";
    int total = 0;
    total += test_forward_site();
    total += test_reverse_site();
    total += test_strand_order();
    total += test_region_mismatch();
    total += test_report();
    total += test_guides();
    total += test_gzipped_guides();

    if (total == 0) {
        std::cout << "\nAll tests passed!\n";
        return 0;
    }
    std::cerr << "\n" << total << " check(s) FAILED.\n";
    return 1;
}
