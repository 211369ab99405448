#include "utils/args.hpp"
#include "info/info.hpp"

int cmd_info(int argc, char* argv[])
{
    Args_Info P = parse_args_info(argc, argv);
    run_info(P);
    return 0;
}
