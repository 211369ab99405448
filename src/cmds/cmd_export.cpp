#include "utils/args.hpp"
#include "utils/log.hpp"
#include "utils/gadgets.hpp"
#include "export/export.hpp"

int cmd_export(int argc, char* argv[])
{
    Args_Export P = parse_args_export(argc, argv);

    Gadget::Timer timer;
    timer.setTime();

    LOG_INFO("Running export ...");
    run_export(P);
    LOG_INFO("export finished.");

    return 0;
}
