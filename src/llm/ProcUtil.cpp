#include "llm/ProcUtil.hpp"

#include <cstdio>
#include <sys/wait.h>

namespace procutil {

std::string run_capture_stdout(const std::string& cmdline, int* exit_code) {
    if (exit_code) *exit_code = -1;

    FILE* pipe = popen(cmdline.c_str(), "r");
    if (!pipe) return "";

    std::string out;
    out.reserve(8192);

    char buf[4096];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) {
        out.append(buf, buf + n);
    }

    const int status = pclose(pipe);
    if (status == -1) return "";

    const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (exit_code) *exit_code = code;
    return out;
}

std::string shell_quote(const std::string& s) {
    std::string o = "'";
    o.reserve(s.size() + 8);
    for (char c : s) {
        if (c == '\'') o += "'\\''";
        else o += c;
    }
    o += "'";
    return o;
}

} // namespace procutil
