//
//  ncfile.cpp
//  asegnc
//

#include "netcdf/ncfile.hpp"
#include "utils/log.hpp"

#include <stdexcept>
#include <utility>

using namespace std;

void nccheck(int status, const string& what)
{
    if (status != NC_NOERR) {
        throw runtime_error(what + ": " + nc_strerror(status));
    }
}

nc_type to_nc_type(DataType t)
{
    switch (t) {
        case DataType::INT8:    return NC_BYTE;
        case DataType::INT16:   return NC_SHORT;
        case DataType::INT32:   return NC_INT;
        case DataType::INT64:   return NC_INT64;
        case DataType::FLOAT32: return NC_FLOAT;
        case DataType::FLOAT64: return NC_DOUBLE;
        case DataType::STRING:  return NC_STRING;
    }
    throw runtime_error("Unhandled data type");
}

DataType from_nc_type(nc_type t)
{
    switch (t) {
        case NC_BYTE:   return DataType::INT8;
        case NC_SHORT:  return DataType::INT16;
        case NC_UBYTE:  return DataType::INT16;
        case NC_INT:    return DataType::INT32;
        case NC_USHORT: return DataType::INT32;
        case NC_UINT:   return DataType::INT64;
        case NC_INT64:  return DataType::INT64;
        case NC_UINT64: return DataType::INT64;
        case NC_FLOAT:  return DataType::FLOAT32;
        case NC_DOUBLE: return DataType::FLOAT64;
        case NC_CHAR:   return DataType::STRING;
        case NC_STRING: return DataType::STRING;
        default: break;
    }
    throw runtime_error("Unhandled netCDF type " + to_string(t));
}

// ---------------------------------------------------------------
// lifetime
// ---------------------------------------------------------------

NcFile NcFile::create(const string& path)
{
    int ncid;
    nccheck(nc_create(path.c_str(), NC_NETCDF4 | NC_CLOBBER, &ncid), "Cannot create " + path);
    return NcFile(ncid, path);
}

NcFile NcFile::open(const string& path)
{
    int ncid;
    nccheck(nc_open(path.c_str(), NC_NOWRITE, &ncid), "Cannot open " + path);
    return NcFile(ncid, path);
}

NcFile::NcFile(NcFile&& other) noexcept
    : ncid_(other.ncid_), path_(std::move(other.path_))
{
    other.ncid_ = -1;
}

NcFile& NcFile::operator=(NcFile&& other) noexcept
{
    if (this != &other) {
        if (ncid_ >= 0) nc_close(ncid_);
        ncid_ = other.ncid_;
        path_ = std::move(other.path_);
        other.ncid_ = -1;
    }
    return *this;
}

NcFile::~NcFile()
{
    if (ncid_ >= 0) {
        int status = nc_close(ncid_);
        if (status != NC_NOERR) {
            LOG_ERROR("Error closing " + path_ + ": " + nc_strerror(status));
        }
    }
}

void NcFile::close()
{
    if (ncid_ < 0) return;
    int ncid = ncid_;
    ncid_ = -1;
    nccheck(nc_close(ncid), "Cannot close " + path_);
}

// ---------------------------------------------------------------
// define mode
// ---------------------------------------------------------------

int NcFile::def_dim(const string& name, size_t len)
{
    int dimid;
    nccheck(nc_def_dim(ncid_, name.c_str(), len, &dimid), "Cannot define dimension " + name);
    return dimid;
}

int NcFile::def_var(const string& name, nc_type type, const vector<int>& dimids)
{
    int varid;
    nccheck(nc_def_var(ncid_, name.c_str(), type, (int)dimids.size(),
                       dimids.empty() ? nullptr : dimids.data(), &varid),
            "Cannot define variable " + name);
    return varid;
}

void NcFile::def_deflate(int varid, int level, bool shuffle)
{
    nccheck(nc_def_var_deflate(ncid_, varid, shuffle ? 1 : 0, level > 0 ? 1 : 0, level),
            "Cannot set compression");
}

void NcFile::def_chunking(int varid, const vector<size_t>& chunks)
{
    nccheck(nc_def_var_chunking(ncid_, varid, NC_CHUNKED, chunks.data()),
            "Cannot set chunking");
}

void NcFile::put_att(int varid, const string& name, const string& value)
{
    nccheck(nc_put_att_text(ncid_, varid, name.c_str(), value.size(), value.c_str()),
            "Cannot write attribute " + name);
}

void NcFile::put_att(int varid, const string& name, nc_type type, double value)
{
    nccheck(nc_put_att_double(ncid_, varid, name.c_str(), type, 1, &value),
            "Cannot write attribute " + name);
}

void NcFile::put_att(int varid, const string& name, nc_type type, int64_t value)
{
    long long v = value;
    nccheck(nc_put_att_longlong(ncid_, varid, name.c_str(), type, 1, &v),
            "Cannot write attribute " + name);
}

void NcFile::enddef()
{
    nccheck(nc_enddef(ncid_), "Cannot leave define mode");
}

// ---------------------------------------------------------------
// data
// ---------------------------------------------------------------

void NcFile::put_var(int varid, const vector<double>& data)
{
    if (data.empty()) return;
    nccheck(nc_put_var_double(ncid_, varid, data.data()), "Cannot write variable " + var_info(varid).name);
}

void NcFile::put_var(int varid, const vector<int64_t>& data)
{
    if (data.empty()) return;
    vector<long long> buf(data.begin(), data.end());
    nccheck(nc_put_var_longlong(ncid_, varid, buf.data()), "Cannot write variable " + var_info(varid).name);
}

void NcFile::put_var(int varid, const vector<int32_t>& data)
{
    if (data.empty()) return;
    vector<int> buf(data.begin(), data.end());
    nccheck(nc_put_var_int(ncid_, varid, buf.data()), "Cannot write variable " + var_info(varid).name);
}

void NcFile::put_var(int varid, const vector<string>& data)
{
    if (data.empty()) return;
    vector<const char*> ptrs;
    ptrs.reserve(data.size());
    for (auto& s : data) ptrs.push_back(s.c_str());
    nccheck(nc_put_var_string(ncid_, varid, ptrs.data()), "Cannot write variable " + var_info(varid).name);
}

void NcFile::put_scalar(int varid, signed char value)
{
    nccheck(nc_put_var_schar(ncid_, varid, &value), "Cannot write variable " + var_info(varid).name);
}

// ---------------------------------------------------------------
// inquiry
// ---------------------------------------------------------------

optional<int> NcFile::dim_id(const string& name) const
{
    int dimid;
    if (nc_inq_dimid(ncid_, name.c_str(), &dimid) != NC_NOERR) return nullopt;
    return dimid;
}

size_t NcFile::dim_len(int dimid) const
{
    size_t len;
    nccheck(nc_inq_dimlen(ncid_, dimid, &len), "Cannot query dimension length");
    return len;
}

string NcFile::dim_name(int dimid) const
{
    char name[NC_MAX_NAME + 1];
    nccheck(nc_inq_dimname(ncid_, dimid, name), "Cannot query dimension name");
    return name;
}

optional<int> NcFile::var_id(const string& name) const
{
    int varid;
    if (nc_inq_varid(ncid_, name.c_str(), &varid) != NC_NOERR) return nullopt;
    return varid;
}

NcVarInfo NcFile::var_info(int varid) const
{
    NcVarInfo info;
    info.id = varid;

    char name[NC_MAX_NAME + 1];
    int ndims = 0;
    nccheck(nc_inq_var(ncid_, varid, name, &info.type, &ndims, nullptr, nullptr),
            "Cannot query variable");
    info.name = name;

    info.dimids.resize((size_t)ndims);
    if (ndims > 0) {
        nccheck(nc_inq_vardimid(ncid_, varid, info.dimids.data()),
                "Cannot query dimensions of " + info.name);
    }
    for (int d : info.dimids) {
        info.dim_names.push_back(dim_name(d));
        info.shape.push_back(dim_len(d));
    }
    return info;
}

vector<NcVarInfo> NcFile::variables() const
{
    int nvars = 0;
    nccheck(nc_inq_nvars(ncid_, &nvars), "Cannot query variables");
    vector<NcVarInfo> out;
    out.reserve((size_t)nvars);
    for (int v = 0; v < nvars; ++v) out.push_back(var_info(v));
    return out;
}

optional<string> NcFile::get_att_text(int varid, const string& name) const
{
    nc_type type;
    size_t len;
    if (nc_inq_att(ncid_, varid, name.c_str(), &type, &len) != NC_NOERR) return nullopt;

    if (type == NC_CHAR) {
        string value(len, '\0');
        nccheck(nc_get_att_text(ncid_, varid, name.c_str(), &value[0]), "Cannot read attribute " + name);
        while (!value.empty() && value.back() == '\0') value.pop_back();
        return value;
    }
    if (type == NC_STRING && len > 0) {
        vector<char*> strs(len, nullptr);
        nccheck(nc_get_att_string(ncid_, varid, name.c_str(), strs.data()), "Cannot read attribute " + name);
        string value = strs[0] ? strs[0] : "";
        nc_free_string(len, strs.data());
        return value;
    }
    return nullopt;
}

optional<double> NcFile::get_att_double(int varid, const string& name) const
{
    nc_type type;
    size_t len;
    if (nc_inq_att(ncid_, varid, name.c_str(), &type, &len) != NC_NOERR) return nullopt;
    if (type == NC_CHAR || type == NC_STRING || len == 0) return nullopt;

    vector<double> values(len);
    nccheck(nc_get_att_double(ncid_, varid, name.c_str(), values.data()), "Cannot read attribute " + name);
    return values[0];
}

size_t NcFile::var_size(int varid) const
{
    size_t n = 1;
    for (size_t len : var_info(varid).shape) n *= len;
    return n;
}

vector<double> NcFile::get_var_double(int varid) const
{
    vector<double> data(var_size(varid));
    if (!data.empty()) {
        nccheck(nc_get_var_double(ncid_, varid, data.data()), "Cannot read variable " + var_info(varid).name);
    }
    return data;
}

vector<int64_t> NcFile::get_var_int64(int varid) const
{
    vector<long long> buf(var_size(varid));
    if (!buf.empty()) {
        nccheck(nc_get_var_longlong(ncid_, varid, buf.data()), "Cannot read variable " + var_info(varid).name);
    }
    return vector<int64_t>(buf.begin(), buf.end());
}

vector<string> NcFile::get_var_strings(int varid) const
{
    NcVarInfo info = var_info(varid);
    vector<string> out;

    if (info.type == NC_STRING) {
        size_t n = var_size(varid);
        if (n == 0) return out;
        vector<char*> strs(n, nullptr);
        nccheck(nc_get_var_string(ncid_, varid, strs.data()), "Cannot read variable " + info.name);
        out.reserve(n);
        for (char* s : strs) out.emplace_back(s ? s : "");
        nc_free_string(n, strs.data());
        return out;
    }

    if (info.type == NC_CHAR) {
        size_t strlen_dim = info.shape.empty() ? 1 : info.shape.back();
        size_t n = var_size(varid);
        if (n == 0 || strlen_dim == 0) return out;
        string buf(n, '\0');
        nccheck(nc_get_var_text(ncid_, varid, &buf[0]), "Cannot read variable " + info.name);
        for (size_t off = 0; off < n; off += strlen_dim) {
            string s = buf.substr(off, strlen_dim);
            size_t nul = s.find('\0');
            if (nul != string::npos) s.erase(nul);
            out.push_back(s);
        }
        return out;
    }

    throw runtime_error("Variable " + info.name + " is not a string variable");
}
