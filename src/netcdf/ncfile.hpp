//
//  ncfile.hpp
//  asegnc
//
//  Thin RAII layer over the netCDF C library. Every library call goes
//  through nccheck(), which throws std::runtime_error with nc_strerror().
//

#ifndef ASEGNC_NCFILE_HPP
#define ASEGNC_NCFILE_HPP

#include "aseg/AsegFormat.hpp"

#include <netcdf.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

void nccheck(int status, const std::string& what);

nc_type to_nc_type(DataType t);
DataType from_nc_type(nc_type t);

struct NcVarInfo {
    int id = -1;
    std::string name;
    nc_type type = NC_NAT;
    std::vector<int> dimids;
    std::vector<std::string> dim_names;
    std::vector<size_t> shape;
};

class NcFile {
public:
    // NetCDF-4, overwrites an existing file
    static NcFile create(const std::string& path);
    // read only
    static NcFile open(const std::string& path);

    NcFile(NcFile&& other) noexcept;
    NcFile& operator=(NcFile&& other) noexcept;
    NcFile(const NcFile&) = delete;
    NcFile& operator=(const NcFile&) = delete;
    ~NcFile();

    void close();
    int id() const { return ncid_; }
    const std::string& path() const { return path_; }

    // ---- define mode ----
    int  def_dim(const std::string& name, size_t len);
    int  def_var(const std::string& name, nc_type type, const std::vector<int>& dimids);
    void def_deflate(int varid, int level, bool shuffle = true);
    void def_chunking(int varid, const std::vector<size_t>& chunks);

    void put_att(int varid, const std::string& name, const std::string& value);
    void put_att(int varid, const std::string& name, nc_type type, double value);
    void put_att(int varid, const std::string& name, nc_type type, int64_t value);

    void enddef();

    // ---- data mode, whole variable ----
    void put_var(int varid, const std::vector<double>& data);
    void put_var(int varid, const std::vector<int64_t>& data);
    void put_var(int varid, const std::vector<int32_t>& data);
    void put_var(int varid, const std::vector<std::string>& data);
    void put_scalar(int varid, signed char value);

    // ---- inquiry ----
    std::optional<int> dim_id(const std::string& name) const;
    size_t dim_len(int dimid) const;
    std::string dim_name(int dimid) const;

    std::optional<int> var_id(const std::string& name) const;
    NcVarInfo var_info(int varid) const;
    std::vector<NcVarInfo> variables() const;

    // text of a NC_CHAR or NC_STRING attribute
    std::optional<std::string> get_att_text(int varid, const std::string& name) const;
    // first value of a numeric attribute
    std::optional<double> get_att_double(int varid, const std::string& name) const;

    std::vector<double>      get_var_double(int varid) const;
    std::vector<int64_t>     get_var_int64(int varid) const;
    // NC_STRING, or NC_CHAR with the last dimension as string length
    std::vector<std::string> get_var_strings(int varid) const;

private:
    NcFile(int ncid, std::string path) : ncid_(ncid), path_(std::move(path)) {}

    size_t var_size(int varid) const;

    int ncid_ = -1;
    std::string path_;
};

#endif
