// Gzip line source backed by rapidgzip's parallel decoder.
// This is the only TU that sees rapidgzip headers; everything else goes
// through the GzLineReader interface in gz_reader_base.hpp.

#ifdef HAVE_RAPIDGZIP
#include <rapidgzip/rapidgzip.hpp>
#include <filereader/Standard.hpp>
#endif

#include "tuscan/gz_reader_base.hpp"
#include <algorithm>
#include <fstream>
#include <memory>
#include <string>

namespace tuscan {

namespace {

#ifdef HAVE_RAPIDGZIP
class ParallelGzLineReader : public GzLineReader {
public:
    explicit ParallelGzLineReader(const std::string& path)
        : decoder_(std::make_unique<rapidgzip::StandardFileReader>(path),
                   0,  // decoder threads from hardware_concurrency
                   GZBUF_SIZE) {
        chunk_.resize(GZBUF_SIZE);
    }

    bool readline(std::string& line) override {
        line.clear();
        for (;;) {
            auto first = chunk_.cbegin() + static_cast<std::ptrdiff_t>(pos_);
            auto last = chunk_.cbegin() + static_cast<std::ptrdiff_t>(filled_);
            auto nl = std::find(first, last, '\n');
            line.append(first, nl);
            if (nl != last) {
                pos_ = static_cast<size_t>(nl - chunk_.cbegin()) + 1;
                return true;
            }
            if (!fill()) return !line.empty();
        }
    }

private:
    bool fill() {
        pos_ = 0;
        filled_ = exhausted_ ? 0 : decoder_.read(chunk_.data(), chunk_.size());
        if (filled_ == 0) exhausted_ = true;
        return filled_ != 0;
    }

    rapidgzip::ParallelGzipReader<> decoder_;
    std::string chunk_;
    size_t pos_ = 0;
    size_t filled_ = 0;
    bool exhausted_ = false;
};
#endif  // HAVE_RAPIDGZIP

}  // namespace

bool is_gzip_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    char magic[2] = {0, 0};
    if (!in.read(magic, 2)) return false;
    return static_cast<unsigned char>(magic[0]) == 0x1f &&
           static_cast<unsigned char>(magic[1]) == 0x8b;
}

std::unique_ptr<GzLineReader> make_gz_reader(const std::string& path) {
#ifdef HAVE_RAPIDGZIP
    if (is_gzip_file(path)) return std::make_unique<ParallelGzLineReader>(path);
#else
    (void)path;
#endif
    return nullptr;
}

}  // namespace tuscan
