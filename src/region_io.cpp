#include "tuscan/region_io.hpp"
#include "tuscan/sequence_io.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace tuscan {

namespace {

bool parse_u64(const std::string& text, uint64_t& value) {
    if (text.empty()) return false;
    uint64_t v = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
        const uint64_t next = v * 10 + static_cast<uint64_t>(c - '0');
        if (next < v) return false;  // overflow
        v = next;
    }
    value = v;
    return true;
}

std::string strip_commas(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c != ',') out += c;
    }
    return out;
}

}  // namespace

Region parse_location(const std::string& location) {
    const size_t colon = location.rfind(':');
    if (colon == std::string::npos || colon == 0) {
        throw std::runtime_error("Invalid location '" + location + "', expected chr:start-end");
    }
    const std::string range = strip_commas(location.substr(colon + 1));
    const size_t dash = range.find('-');
    if (dash == std::string::npos) {
        throw std::runtime_error("Invalid location '" + location + "', expected chr:start-end");
    }

    uint64_t start1 = 0, end1 = 0;
    if (!parse_u64(range.substr(0, dash), start1) || !parse_u64(range.substr(dash + 1), end1)) {
        throw std::runtime_error("Invalid coordinates in location '" + location + "'");
    }
    if (start1 == 0 || end1 < start1) {
        throw std::runtime_error("Invalid range in location '" + location +
                                 "': start must be >= 1 and <= end");
    }

    Region r;
    r.chrom = location.substr(0, colon);
    r.start = start1 - 1;
    r.end = end1;
    return r;
}

std::vector<Region> read_bed(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Failed to open file: " + path);
    }

    std::vector<Region> regions;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        if (line.compare(0, 5, "track") == 0 || line.compare(0, 7, "browser") == 0) continue;

        std::istringstream fields(line);
        std::string chrom, start_str, end_str;
        if (!(fields >> chrom >> start_str >> end_str)) {
            throw std::runtime_error(path + ":" + std::to_string(line_no) +
                                     ": BED line needs at least 3 columns");
        }

        Region r;
        r.chrom = chrom;
        if (!parse_u64(start_str, r.start) || !parse_u64(end_str, r.end)) {
            throw std::runtime_error(path + ":" + std::to_string(line_no) +
                                     ": non-numeric BED coordinates");
        }
        if (r.end < r.start) {
            throw std::runtime_error(path + ":" + std::to_string(line_no) +
                                     ": BED end is before start");
        }
        regions.push_back(std::move(r));
    }
    return regions;
}

std::vector<ScanTarget> fetch_regions(const std::string& genome_fasta,
                                      const std::vector<Region>& regions) {
    std::unordered_set<std::string> wanted;
    for (const auto& r : regions) wanted.insert(r.chrom);

    std::unordered_map<std::string, std::string> chroms;
    SequenceReader reader(genome_fasta);
    SequenceRecord record;
    while (chroms.size() < wanted.size() && reader.read_next(record)) {
        if (wanted.count(record.id)) {
            chroms[record.id] = SequenceUtils::clean(record.sequence);
        }
    }

    std::vector<ScanTarget> targets;
    targets.reserve(regions.size());
    for (const auto& r : regions) {
        auto it = chroms.find(r.chrom);
        if (it == chroms.end()) {
            throw std::runtime_error("Chromosome '" + r.chrom + "' not found in " + genome_fasta);
        }
        if (r.end > it->second.size()) {
            throw std::runtime_error("Region " + r.chrom + ":" + std::to_string(r.start + 1) + "-" +
                                     std::to_string(r.end) + " extends past chromosome end (" +
                                     std::to_string(it->second.size()) + " bp)");
        }
        ScanTarget t;
        t.region = r;
        t.sequence = it->second.substr(r.start, r.end - r.start);
        targets.push_back(std::move(t));
    }
    return targets;
}

void for_each_fasta_target(const std::string& fasta,
                           const std::function<void(ScanTarget&&)>& callback) {
    SequenceReader reader(fasta);
    SequenceRecord record;
    while (reader.read_next(record)) {
        ScanTarget t;
        t.sequence = SequenceUtils::clean(record.sequence);
        t.region.chrom = record.id;
        t.region.start = 0;
        t.region.end = t.sequence.size();
        callback(std::move(t));
    }
}

}  // namespace tuscan
