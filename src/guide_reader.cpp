#include "tuscan/guide_reader.hpp"
#include "tuscan/sequence_io.hpp"

#include <cctype>
#include <cstring>
#include <stdexcept>
#include <zlib.h>

namespace tuscan {

namespace {

bool has_pam(const std::string& seq) {
    return seq[CORE_LENGTH] == 'G' && seq[CORE_LENGTH + 1] == 'G';
}

// Plain or gzip text, read line by line (gzread is transparent for plain files)
class GuideLines {
public:
    explicit GuideLines(const std::string& path) : path_(path) {
        gz_ = gzopen(path.c_str(), "rb");
        if (!gz_) {
            throw std::runtime_error("Failed to open file: " + path);
        }
        gzbuffer(gz_, 1024 * 1024);
    }
    ~GuideLines() {
        if (gz_) gzclose(gz_);
    }
    GuideLines(const GuideLines&) = delete;
    GuideLines& operator=(const GuideLines&) = delete;

    bool next(std::string& line) {
        line.clear();
        bool got = false;
        while (gzgets(gz_, buffer_, sizeof(buffer_))) {
            got = true;
            size_t len = std::strlen(buffer_);
            if (len > 0 && buffer_[len - 1] == '\n') {
                line.append(buffer_, len - 1);
                break;
            }
            line.append(buffer_, len);
        }
        int errnum = 0;
        const char* msg = gzerror(gz_, &errnum);
        if (errnum != Z_OK && errnum != Z_STREAM_END) {
            throw std::runtime_error(path_ + ": read error: " + msg);
        }
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return got;
    }

private:
    std::string path_;
    gzFile gz_ = nullptr;
    char buffer_[4096];
};

// FASTA when the first decompressed non-space character is '>'
bool looks_like_fasta(const std::string& path) {
    GuideLines in(path);
    std::string line;
    while (in.next(line)) {
        for (char c : line) {
            if (!std::isspace(static_cast<unsigned char>(c))) return c == '>';
        }
    }
    return false;
}

std::string describe(GuideCheck check, size_t line, size_t length) {
    const std::string where = "The sequence at line " + std::to_string(line);
    switch (check) {
        case GuideCheck::INVALID_NUCLEOTIDE:
            return where + " contains an invalid nucleotide";
        case GuideCheck::BAD_LENGTH:
            return where + " is not " + std::to_string(MATCH_FOOTPRINT) +
                   " base pairs, it is " + std::to_string(length);
        case GuideCheck::NO_PAM:
            return where + " does not have a PAM motif";
        default:
            return where + " is valid";
    }
}

// Shared per-sequence handling for both input layouts
void accept(const std::string& id, const std::string& raw, size_t line,
            std::vector<GuideRecord>& out, const GuideWarning& warn) {
    GuideRecord rec;
    GuideCheck check = check_guide(raw, rec.sequence, rec.dir);
    if (check != GuideCheck::OK) {
        if (warn) warn(check, describe(check, line, raw.size()));
        return;
    }
    if (rec.dir == Strand::REVERSE && warn) {
        warn(GuideCheck::OK, "The sequence at line " + std::to_string(line) + " was in the negative orientation");
    }
    rec.id = id;
    rec.line = line;
    out.push_back(std::move(rec));
}

}  // namespace

GuideCheck check_guide(const std::string& raw, std::string& oriented, Strand& dir) {
    std::string seq = SequenceUtils::clean(raw);
    if (!SequenceUtils::is_acgt(seq)) return GuideCheck::INVALID_NUCLEOTIDE;
    if (seq.size() != MATCH_FOOTPRINT) return GuideCheck::BAD_LENGTH;

    if (has_pam(seq)) {
        oriented = std::move(seq);
        dir = Strand::FORWARD;
        return GuideCheck::OK;
    }
    std::string rc = SequenceUtils::reverse_complement(seq);
    if (has_pam(rc)) {
        oriented = std::move(rc);
        dir = Strand::REVERSE;
        return GuideCheck::OK;
    }
    return GuideCheck::NO_PAM;
}

std::vector<GuideRecord> read_guides(const std::string& path, const GuideWarning& warn) {
    std::vector<GuideRecord> guides;

    if (looks_like_fasta(path)) {
        SequenceReader reader(path);
        SequenceRecord record;
        size_t n = 0;
        while (reader.read_next(record)) {
            ++n;
            accept(record.id, record.sequence, n, guides, warn);
        }
        return guides;
    }

    GuideLines in(path);
    std::string line;
    size_t line_no = 0;
    while (in.next(line)) {
        ++line_no;
        if (line.find_first_not_of(" \t") == std::string::npos) continue;
        accept(std::to_string(line_no), line, line_no, guides, warn);
    }
    return guides;
}

}  // namespace tuscan
