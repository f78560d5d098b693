#include "extract/ProcUtil.hpp"

#include <stdio.h>
#include <sys/wait.h>

namespace procutil {

ProcResult run_capture_stdout(const std::string& cmdline) {
    ProcResult res;

    FILE* pipe = popen(cmdline.c_str(), "r");
    if (!pipe) return res;

    res.out.reserve(8192);

    char buf[4096];
    while (true) {
        size_t n = fread(buf, 1, sizeof(buf), pipe);
        if (n == 0) break;
        res.out.append(buf, buf + n);
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

std::string shell_quote(const std::string& arg) {
    std::string o;
    o.reserve(arg.size() + 2);
    o += '\'';
    for (char c : arg) {
        if (c == '\'') o += "'\\''";
        else o += c;
    }
    o += '\'';
    return o;
}

} // namespace procutil
