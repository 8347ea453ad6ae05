#include "commands/extract.hpp"
#include "commands/verify.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  idcheck verify --reference <json> (--text <txt> | --image <img>) [args]\n"
        << "  idcheck extract (--text <txt> | --image <img>) [args]\n"
        << "  idcheck help\n"
        << "\n"
        << "  idcheck <command> --help   for command options\n";
    return 1;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage();
        return 0;
    }

    // subcommand help
    if (cmd == "verify"  && (argc >= 3 && std::string(argv[2]) == "--help")) return print_verify_help();
    if (cmd == "extract" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_extract_help();

    if (cmd == "verify")  return cmd_verify(argc - 1, argv + 1);
    if (cmd == "extract") return cmd_extract(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
