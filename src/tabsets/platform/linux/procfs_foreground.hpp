#pragma once

#include <optional>
#include <string>

// Finds the foreground process of a terminal by scanning /proc.
class ProcfsForeground {
public:
    struct StatFields {
        int pid = 0;
        std::string comm;
        int ppid = 0;
        int pgrp = 0;
        int tty_nr = 0;
        int tpgid = 0;
    };

    // Scans /proc on behalf of the calling process's own group.
    ProcfsForeground();
    ProcfsForeground(std::string proc_root, int own_pgrp);

    // Executable path of the process leading the terminal's foreground
    // process group, falling back to its comm. When that group is our own
    // (we were started from this terminal), the leader's parent is reported:
    // the shell that is waiting for us. Empty if none is found.
    std::string foreground_process(const std::string& tty_name) const;

    // Parses the contents of /proc/<pid>/stat.
    static std::optional<StatFields> parse_stat(const std::string& line);

    // Splits the kernel's tty_nr encoding into major/minor.
    static unsigned tty_major(int tty_nr);
    static unsigned tty_minor(int tty_nr);

private:
    std::string describe(const StatFields& fields) const;
    std::string read_stat(int pid) const;
    std::string read_exe(int pid) const;

    std::string proc_root_;
    int own_pgrp_;
};
