#pragma once

// idcheck extract (--text <txt> | --image <img>) [--as_of yyyy-mm-dd] [--strict_id]
int cmd_extract(int argc, char** argv);

int print_extract_help();
