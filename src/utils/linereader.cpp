//
//  linereader.cpp
//  asegnc
//

#include "utils/linereader.hpp"
#include "utils/util.hpp"

#include <stdexcept>

LineReader::LineReader(const std::string& filename)
    : filename_(filename)
{
    fp_ = gzopen(filename.c_str(), "rb");
    if (!fp_) {
        throw std::runtime_error("Cannot open file for reading: " + filename);
    }
    gzbuffer(fp_, 1 << 17);
}

LineReader::~LineReader()
{
    if (fp_) gzclose(fp_);
}

bool LineReader::getline(std::string& line)
{
    line.clear();
    bool got_any = false;

    // lines longer than the buffer come back in pieces
    while (gzgets(fp_, buf_, sizeof(buf_)) != nullptr) {
        got_any = true;
        line.append(buf_);
        if (!line.empty() && line.back() == '\n') {
            line.pop_back();
            break;
        }
    }

    if (!got_any) {
        int err = 0;
        const char* msg = gzerror(fp_, &err);
        if (err != Z_OK && err != Z_STREAM_END) {
            throw std::runtime_error("Read error in " + filename_ + ": " + msg);
        }
        return false;
    }

    strip_cr_inplace(line);
    ++lineno_;
    return true;
}
