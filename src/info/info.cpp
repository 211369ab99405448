//
//  info.cpp
//  asegnc
//

#include "info/info.hpp"
#include "utils/log.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

using namespace std;

static void print_record(ostringstream& os, const RecordDef& rec, bool with_dtype)
{
    os << left
       << setw(16) << "FIELD"
       << setw(16) << "VARIABLE"
       << setw(10) << "FORMAT";
    if (with_dtype) os << setw(9) << "DTYPE";
    os << setw(6) << "COLS"
       << setw(8) << "OFFSET"
       << setw(7) << "WIDTH"
       << setw(10) << "UNITS"
       << setw(14) << "NULL"
       << "LONG_NAME\n";

    for (const auto& f : rec.fields) {
        os << setw(16) << f.name
           << setw(16) << (f.is_record_type ? "-" : f.short_name)
           << setw(10) << f.format;
        if (with_dtype) os << setw(9) << dtype_name(aseg_format_to_dtype(f.decoded));
        os << setw(6) << f.decoded.columns
           << setw(8) << f.offset
           << setw(7) << f.width()
           << setw(10) << (f.units.empty() ? "-" : f.units)
           << setw(14) << (f.null_text ? *f.null_text : "-")
           << f.long_name << "\n";
    }
}

string format_dfn_table(const DfnDefinition& dfn)
{
    ostringstream os;
    os << "Definition file: " << dfn.path << "\n";
    os << "Data record (RT=" << dfn.data.record_type << "), width " << dfn.data.width << "\n";
    print_record(os, dfn.data, true);

    for (const auto& r : dfn.others) {
        os << "\nRecord RT=" << r.record_type << ", width " << r.width << "\n";
        print_record(os, r, false);
    }
    return os.str();
}

void run_info(const Args_Info& P)
{
    DfnDefinition dfn = parse_dfn(P.dfn_file);
    cout << format_dfn_table(dfn);
}
