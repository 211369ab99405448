//
//  linereader.hpp
//  asegnc
//

#ifndef ASEGNC_LINEREADER_HPP
#define ASEGNC_LINEREADER_HPP

#include <string>
#include <zlib.h>

// line reader for plain text and gzip files.
// gzopen reads uncompressed files transparently, so one path serves both.
class LineReader {
public:
    explicit LineReader(const std::string& filename);
    ~LineReader();

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    // false at EOF; line has no trailing '\n' or '\r'
    bool getline(std::string& line);
    size_t line_number() const { return lineno_; }

private:
    gzFile fp_ = nullptr;
    std::string filename_;
    size_t lineno_ = 0;
    char buf_[1 << 16];
};

#endif
