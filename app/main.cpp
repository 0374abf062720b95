#include "commands/schema.hpp"
#include "commands/validate.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  csvcheck validate --file <csv> --schema <json> [options]\n"
        << "  csvcheck schema --schema <json>\n"
        << "  csvcheck help\n"
        << "\n"
        << "  csvcheck validate --help   for validation options\n";
    return 2;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage();
        return 0;
    }

    if (cmd == "validate") return cmd_validate(argc - 1, argv + 1);
    if (cmd == "schema")   return cmd_schema(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
