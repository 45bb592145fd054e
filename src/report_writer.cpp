#include "tuscan/report_writer.hpp"
#include <cinttypes>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace tuscan {

class ReportWriter::Impl {
public:
    std::ofstream file_;
    std::ostream* out_ = nullptr;
    std::string name_;
    Layout layout_ = Layout::SCAN;
    size_t rows_ = 0;
    bool closed_ = false;
    static constexpr size_t BUFFER_SIZE = 1024 * 1024;  // 1MB buffer
    char buffer_[BUFFER_SIZE];
    char fmt_buffer_[1024];  // Reusable formatting buffer

    void write(const char* data, int len) {
        if (len < 0 || static_cast<size_t>(len) >= sizeof(fmt_buffer_)) {
            throw std::runtime_error("Report row too long for " + name_);
        }
        out_->write(data, len);
        if (!*out_) {
            throw std::runtime_error("Failed writing report: " + name_);
        }
    }
};

ReportWriter::ReportWriter(const std::string& filename, Layout layout)
    : impl_(std::make_unique<Impl>()) {
    impl_->layout_ = layout;
    impl_->name_ = filename;
    if (filename == "-") {
        impl_->out_ = &std::cout;
        impl_->name_ = "stdout";
        return;
    }
    // Larger buffer before open so it takes effect on every libstdc++
    impl_->file_.rdbuf()->pubsetbuf(impl_->buffer_, Impl::BUFFER_SIZE);
    impl_->file_.open(filename);
    if (!impl_->file_) {
        throw std::runtime_error("Failed to open file: " + filename);
    }
    impl_->out_ = &impl_->file_;
}

ReportWriter::~ReportWriter() {
    if (!impl_->closed_) {
        // Destructor must not throw; explicit close() reports errors
        impl_->out_->flush();
        if (impl_->file_.is_open()) impl_->file_.close();
    }
}

void ReportWriter::write_header() {
    int len;
    if (impl_->layout_ == Layout::SCAN) {
        len = snprintf(impl_->fmt_buffer_, sizeof(impl_->fmt_buffer_),
                       "%-20s %-12s %-12s %-7s %-30s %s\n",
                       "Chromosome", "Start", "End", "Strand", "Sequence", "Score");
    } else {
        len = snprintf(impl_->fmt_buffer_, sizeof(impl_->fmt_buffer_),
                       "%-50s %-31s %-15s %-3s\n", "ID", "Sequence", "Score", "Dir");
    }
    impl_->write(impl_->fmt_buffer_, len);
}

void ReportWriter::write_site(const ScoredCandidate& site) {
    const std::string seq = site.window.str();
    int len = snprintf(impl_->fmt_buffer_, sizeof(impl_->fmt_buffer_),
        "%-20s %-12" PRIu64 " %-12" PRIu64 " %-7c %-30s %g\n",
        site.chrom.c_str(),
        site.start,
        site.end,
        strand_symbol(site.strand),
        seq.c_str(),
        static_cast<double>(site.score));
    impl_->write(impl_->fmt_buffer_, len);
    ++impl_->rows_;
}

void ReportWriter::write_sequence(const std::string& id, const std::string& sequence,
                                  float score, Strand dir) {
    int len = snprintf(impl_->fmt_buffer_, sizeof(impl_->fmt_buffer_),
        "%-50s %-31s %-15g %-3c\n",
        id.c_str(),
        sequence.c_str(),
        static_cast<double>(score),
        strand_symbol(dir));
    impl_->write(impl_->fmt_buffer_, len);
    ++impl_->rows_;
}

size_t ReportWriter::rows_written() const {
    return impl_->rows_;
}

void ReportWriter::close() {
    if (impl_->closed_) return;
    impl_->closed_ = true;
    impl_->out_->flush();
    const bool ok = static_cast<bool>(*impl_->out_);
    if (impl_->file_.is_open()) impl_->file_.close();
    if (!ok || impl_->file_.fail()) {
        throw std::runtime_error("Failed writing report: " + impl_->name_);
    }
}

}  // namespace tuscan
