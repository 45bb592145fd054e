#include "tuscan/sequence_io.hpp"
#include "tuscan/gz_reader_base.hpp"
#include <algorithm>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <zlib.h>

namespace tuscan {

// SequenceReader implementation
class SequenceReader::Impl {
public:
    std::ifstream file_;
    gzFile gz_file_ = nullptr;
    std::unique_ptr<GzLineReader> rapid_;
    bool is_gzipped_ = false;
    char buffer_[65536];  // gzgets line buffer
    std::string lookahead_line_;  // Header of the next record
    bool has_lookahead_ = false;

    bool open(const std::string& filename) {
        if (is_gzip_file(filename)) {
            is_gzipped_ = true;

            // Parallel decompression when available
            rapid_ = make_gz_reader(filename);
            if (rapid_) return true;

            gz_file_ = gzopen(filename.c_str(), "rb");
            if (!gz_file_) return false;
            gzbuffer(gz_file_, GzLineReader::GZBUF_SIZE);
            return true;
        }
        file_.open(filename);
        return static_cast<bool>(file_);
    }

    bool getline(std::string& line) {
        if (!is_gzipped_) {
            if (!std::getline(file_, line)) return false;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        if (rapid_) {
            if (!rapid_->readline(line)) return false;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }

        // gzgets stops at buffer size; keep reading until the newline
        line.clear();
        while (gzgets(gz_file_, buffer_, sizeof(buffer_))) {
            size_t len = strlen(buffer_);
            if (len > 0 && buffer_[len - 1] == '\n') {
                line.append(buffer_, len - 1);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                return true;
            }
            line.append(buffer_, len);
        }
        int errnum = 0;
        const char* msg = gzerror(gz_file_, &errnum);
        if (errnum != Z_OK && errnum != Z_STREAM_END) {
            throw std::runtime_error(std::string("gzip read error: ") + msg);
        }
        return !line.empty();
    }

    void close() {
        if (gz_file_) {
            gzclose(gz_file_);
            gz_file_ = nullptr;
        }
        rapid_.reset();
        if (file_.is_open()) file_.close();
    }

    ~Impl() {
        close();
    }
};

SequenceReader::SequenceReader(const std::string& filename)
    : impl_(std::make_unique<Impl>()) {
    if (!impl_->open(filename)) {
        throw std::runtime_error("Failed to open file: " + filename);
    }
}

SequenceReader::~SequenceReader() = default;

bool SequenceReader::read_next(SequenceRecord& record) {
    std::string line;

    if (impl_->has_lookahead_) {
        line = std::move(impl_->lookahead_line_);
        impl_->has_lookahead_ = false;
    } else if (!impl_->getline(line)) {
        return false;
    }

    // Skip empty lines
    while (line.empty()) {
        if (!impl_->getline(line)) return false;
    }

    if (line[0] != '>') {
        throw std::runtime_error("Malformed FASTA: expected '>' header, got '" +
                                 line.substr(0, 40) + "'");
    }

    const char* hdr = line.c_str() + 1;
    const char* space = strpbrk(hdr, " \t");
    if (space) {
        record.id.assign(hdr, space - hdr);
        record.description.assign(space + 1);
    } else {
        record.id.assign(hdr);
        record.description.clear();
    }

    // Read sequence lines until next header or EOF
    record.sequence.clear();
    while (impl_->getline(line)) {
        if (line.empty()) continue;
        if (line[0] == '>') {
            impl_->lookahead_line_ = std::move(line);
            impl_->has_lookahead_ = true;
            break;
        }
        record.sequence += line;
    }

    return true;
}

std::vector<SequenceRecord> SequenceReader::read_all() {
    std::vector<SequenceRecord> records;
    SequenceRecord record;
    while (read_next(record)) {
        records.push_back(record);
    }
    return records;
}

std::string SequenceUtils::reverse_complement(const std::string& seq) {
    std::string rc = seq;
    std::reverse(rc.begin(), rc.end());
    for (char& c : rc) {
        c = complement(c);
    }
    return rc;
}

char SequenceUtils::complement(char nt) {
    switch(nt) {
        case 'A': return 'T';
        case 'T': return 'A';
        case 'C': return 'G';
        case 'G': return 'C';
        case 'a': return 't';
        case 't': return 'a';
        case 'c': return 'g';
        case 'g': return 'c';
        default: return nt;
    }
}

bool SequenceUtils::is_acgt(const std::string& seq) {
    for (char c : seq) {
        if (c != 'A' && c != 'C' && c != 'G' && c != 'T') {
            return false;
        }
    }
    return true;
}

std::string SequenceUtils::clean(const std::string& seq) {
    // Fast-path: most genome FASTA is already uppercase without whitespace
    bool needs_cleaning = false;
    for (char c : seq) {
        if (c <= ' ' || (c >= 'a' && c <= 'z')) {
            needs_cleaning = true;
            break;
        }
    }

    if (!needs_cleaning) {
        return seq;
    }

    std::string cleaned;
    cleaned.reserve(seq.length());

    for (char c : seq) {
        if (c <= ' ') continue;
        if (c >= 'a' && c <= 'z') {
            cleaned += (c - 32);
        } else {
            cleaned += c;
        }
    }
    return cleaned;
}

}  // namespace tuscan
