#pragma once

#include <cstddef>
#include <memory>
#include <string>

namespace tuscan {

/**
 * Line source over a gzip stream.
 *
 * The parallel (rapidgzip) implementation lives in src/sequence_io_backend.cpp
 * and is compiled only with HAVE_RAPIDGZIP; SequenceReader falls back to
 * zlib's gzgets when make_gz_reader() returns nullptr.
 */
class GzLineReader {
public:
    // Decoder chunk size, also used as the zlib gzbuffer size
    static constexpr size_t GZBUF_SIZE = 4 * 1024 * 1024;

    virtual ~GzLineReader() = default;

    // Next line without its '\n'. False at end of stream.
    virtual bool readline(std::string& line) = 0;
};

// Checks the first two bytes for the gzip magic (1f 8b)
bool is_gzip_file(const std::string& path);

std::unique_ptr<GzLineReader> make_gz_reader(const std::string& path);

}  // namespace tuscan
