#pragma once

// idcheck verify --reference <json> (--text <txt> | --image <img>) [options]
// exit: 0 all fields match, 2 mismatch, 1 error
int cmd_verify(int argc, char** argv);

int print_verify_help();
