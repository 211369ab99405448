//
//  info.hpp
//  asegnc
//

#ifndef ASEGNC_INFO_HPP
#define ASEGNC_INFO_HPP

#include "utils/args.hpp"
#include "aseg/dfn.hpp"

#include <string>

// field table of a definition, one row per field
std::string format_dfn_table(const DfnDefinition& dfn);

void run_info(const Args_Info& P);

#endif
