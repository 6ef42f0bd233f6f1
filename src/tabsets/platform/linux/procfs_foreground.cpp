#include "platform/linux/procfs_foreground.hpp"

#include <charconv>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <sys/sysmacros.h>
#include <unistd.h>
#include <utility>

namespace fs = std::filesystem;

ProcfsForeground::ProcfsForeground()
    : ProcfsForeground("/proc", ::getpgrp()) {}

ProcfsForeground::ProcfsForeground(std::string proc_root, int own_pgrp)
    : proc_root_(std::move(proc_root)), own_pgrp_(own_pgrp) {}

std::string ProcfsForeground::foreground_process(const std::string& tty_name) const {
    if (tty_name.empty()) return {};

    struct stat st{};
    if (::stat(tty_name.c_str(), &st) != 0 || !S_ISCHR(st.st_mode)) return {};
    unsigned want_major = major(st.st_rdev);
    unsigned want_minor = minor(st.st_rdev);

    std::error_code ec;
    for (auto& entry : fs::directory_iterator(proc_root_, ec)) {
        auto name = entry.path().filename().string();
        int pid = 0;
        auto [ptr, err] = std::from_chars(name.data(), name.data() + name.size(), pid);
        if (err != std::errc{} || ptr != name.data() + name.size()) continue;

        auto fields = parse_stat(read_stat(pid));
        if (!fields || fields->tty_nr == 0) continue;
        if (tty_major(fields->tty_nr) != want_major || tty_minor(fields->tty_nr) != want_minor) continue;

        // The group leader of the foreground process group
        if (fields->pid != fields->tpgid) continue;

        if (fields->pgrp == own_pgrp_) {
            auto parent = parse_stat(read_stat(fields->ppid));
            if (parent && parent->tty_nr == fields->tty_nr) return describe(*parent);
        }
        return describe(*fields);
    }
    return {};
}

std::optional<ProcfsForeground::StatFields> ProcfsForeground::parse_stat(const std::string& line) {
    // pid (comm) state ppid pgrp session tty_nr tpgid ...
    // comm may itself contain spaces and parentheses.
    auto open = line.find('(');
    auto close = line.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) return std::nullopt;

    StatFields fields;
    auto [ptr, err] = std::from_chars(line.data(), line.data() + open, fields.pid);
    if (err != std::errc{}) return std::nullopt;
    fields.comm = line.substr(open + 1, close - open - 1);

    std::istringstream rest(line.substr(close + 1));
    std::string state;
    int session = 0;
    if (!(rest >> state >> fields.ppid >> fields.pgrp >> session >> fields.tty_nr >> fields.tpgid)) {
        return std::nullopt;
    }
    return fields;
}

unsigned ProcfsForeground::tty_major(int tty_nr) {
    auto v = static_cast<unsigned>(tty_nr);
    return (v >> 8) & 0xfff;
}

unsigned ProcfsForeground::tty_minor(int tty_nr) {
    auto v = static_cast<unsigned>(tty_nr);
    return (v & 0xff) | ((v >> 12) & 0xfff00);
}

std::string ProcfsForeground::describe(const StatFields& fields) const {
    auto exe = read_exe(fields.pid);
    if (!exe.empty()) return exe;
    return fields.comm;
}

std::string ProcfsForeground::read_stat(int pid) const {
    std::ifstream f(std::format("{}/{}/stat", proc_root_, pid));
    if (!f.is_open()) return {};
    std::string line;
    std::getline(f, line);
    return line;
}

std::string ProcfsForeground::read_exe(int pid) const {
    std::error_code ec;
    auto path = fs::read_symlink(std::format("{}/{}/exe", proc_root_, pid), ec);
    if (ec) return {};
    return path.string();
}
