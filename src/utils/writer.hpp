//
//  writer.hpp
//  asegnc
//

#ifndef ASEGNC_WRITER_HPP
#define ASEGNC_WRITER_HPP

#include <string>
#include <fstream>
#include <zlib.h>

// filename ending in ".gz" -> gzip via gzopen
// otherwise -> plain text via ofstream
class Writer {
public:
    explicit Writer(const std::string &filename);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    void write_line(const std::string &line);
    bool good() const { return ok_; }

    // flush and close; false if anything failed on the way
    bool close();

private:
    bool use_gz_ = false;
    bool ok_ = false;

    std::string filename_;
    std::ofstream ofs_;
    gzFile gzfp_ = nullptr;
};

#endif
