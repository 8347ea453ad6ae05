#include "ocr/ProcUtil.hpp"

#include <cstdio>
#include <cstdlib>
#include <sys/wait.h>

namespace procutil {

ProcResult run_capture_stdout(const std::string& cmdline) {
    ProcResult res;

    FILE* pipe = popen(cmdline.c_str(), "r");
    if (!pipe) {
        return res;
    }

    res.output.reserve(8192);

    char buf[4096];
    while (true) {
        size_t n = std::fread(buf, 1, sizeof(buf), pipe);
        if (n > 0) res.output.append(buf, n);
        if (n < sizeof(buf)) break;
    }

    int status = pclose(pipe);
    if (status == -1) {
        res.exit_code = -1;
    } else if (WIFEXITED(status)) {
        res.exit_code = WEXITSTATUS(status);
    } else {
        res.exit_code = 128;
    }
    return res;
}

bool command_exists(const std::string& name) {
    std::string test = "command -v " + shell_quote(name) + " >/dev/null 2>&1";
    return std::system(test.c_str()) == 0;
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out += "'";
    return out;
}

} // namespace procutil
