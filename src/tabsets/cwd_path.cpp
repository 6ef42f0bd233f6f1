#include "cwd_path.hpp"

#include <string_view>

namespace {

constexpr std::string_view FILE_SCHEME = "file://";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percent_decode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

bool is_drive_letter(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

} // namespace

std::string path_from_cwd(const std::string& cwd, PathStyle style) {
    std::string_view rest(cwd);
    if (!rest.starts_with(FILE_SCHEME)) return cwd;
    rest.remove_prefix(FILE_SCHEME.size());

    // Authority (host name) runs up to the first '/'.
    auto slash = rest.find('/');
    if (slash == std::string_view::npos) return "/";
    rest.remove_prefix(slash);

    auto path = percent_decode(rest);

    if (style == PathStyle::Windows && path.size() >= 3 && path[0] == '/' &&
        is_drive_letter(path[1]) && path[2] == ':') {
        path.erase(0, 1);
    }
    return path;
}
