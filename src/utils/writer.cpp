//
//  writer.cpp
//  asegnc
//

#include "utils/writer.hpp"
#include "utils/util.hpp"
#include "utils/log.hpp"

Writer::Writer(const std::string &filename)
    : use_gz_(ends_with(filename, ".gz")), filename_(filename)
{
    if (use_gz_) gzfp_ = gzopen(filename.c_str(), "wb");
    else         ofs_.open(filename);

    ok_ = use_gz_ ? gzfp_ != nullptr : ofs_.is_open();
    if (!ok_) {
        LOG_ERROR("Error: cannot open " + std::string(use_gz_ ? "gzip" : "text") +
                  " file for writing: " + filename);
    }
}

Writer::~Writer()
{
    close();
}

void Writer::write_line(const std::string &line)
{
    if (!ok_) return;

    if (use_gz_) {
        if (gzwrite(gzfp_, line.data(), (unsigned)line.size()) != (int)line.size() ||
            gzputc(gzfp_, '\n') != '\n') {
            LOG_ERROR("Error: write failed: " + filename_);
            ok_ = false;
        }
    } else {
        ofs_ << line << '\n';
        if (!ofs_) {
            LOG_ERROR("Error: write failed: " + filename_);
            ok_ = false;
        }
    }
}

bool Writer::close()
{
    if (use_gz_) {
        if (gzfp_) {
            if (gzclose(gzfp_) != Z_OK) ok_ = false;
            gzfp_ = nullptr;
        }
    } else if (ofs_.is_open()) {
        ofs_.close();
        if (ofs_.fail()) ok_ = false;
    }
    return ok_;
}
