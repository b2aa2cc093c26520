#include "SNPLOF_merger.h"
#include "snplof_core.h"
#include "snplof_io.h"

static void show_help() {
    SNPLOFMerger obj;
    char arg0[] = "SNPLOF_merger";
    char arg1[] = "--help";
    char *argv2[] = {arg0, arg1, nullptr};
    obj.run(2, argv2);
}

int main(int argc, char *argv[]) {
    snplof::init_io();
    if (snplof::handle_common_flags(argc, argv, "SNPLOF_merger", show_help))
        return 0;
    SNPLOFMerger merger;
    return merger.run(argc, argv);
}
