#include "utils.hpp"
#include "types.hpp"
#include <map>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:             return "none";
        case ErrorKind::Connection:       return "connection";
        case ErrorKind::StaleHandle:      return "stale-handle";
        case ErrorKind::RemoteFilesystem: return "remote-filesystem";
        case ErrorKind::Transfer:         return "transfer";
        case ErrorKind::ProcessSpawn:     return "process-spawn";
        case ErrorKind::StreamRead:       return "stream-read";
        case ErrorKind::State:            return "state";
        case ErrorKind::Config:           return "config";
        case ErrorKind::Compile:          return "compile";
        case ErrorKind::Discovery:        return "discovery";
    }
    return "unknown";
}

std::string join_remote_path(const std::string& base, const std::string& rel) {
    if (base.empty()) return rel;
    if (rel.empty()) return base;

    std::string left = base;
    while (left.size() > 1 && left.back() == '/') left.pop_back();

    size_t start = 0;
    while (start < rel.size() && rel[start] == '/') start++;

    if (left == "/") return "/" + rel.substr(start);
    return left + "/" + rel.substr(start);
}

static std::vector<std::string> split_segments(const std::string& path) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : path) {
        if (c == '/' || c == '\\') {
            if (!cur.empty() && cur != ".") parts.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (!cur.empty() && cur != ".") parts.push_back(cur);
    return parts;
}

std::vector<std::string> parent_segments(const std::string& rel_path) {
    auto parts = split_segments(rel_path);
    // Trailing separator means the whole path is a directory
    bool is_dir = !rel_path.empty() && (rel_path.back() == '/' || rel_path.back() == '\\');
    if (!is_dir && !parts.empty()) parts.pop_back();
    return parts;
}

std::string to_remote_relative(const std::string& rel_path) {
    std::string out;
    for (const auto& p : split_segments(rel_path)) {
        if (!out.empty()) out += "/";
        out += p;
    }
    return out;
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string fill_placeholder(const std::string& tmpl, const std::string& value) {
    auto pos = tmpl.find("{}");
    if (pos == std::string::npos) {
        return tmpl + " " + value;
    }
    return tmpl.substr(0, pos) + value + tmpl.substr(pos + 2);
}

int signal_exit_code(const std::string& signal_name) {
    // Numbers on the brick's side (Linux), not the host's
    static const std::map<std::string, int> signals = {
        {"HUP", 1},   {"INT", 2},   {"QUIT", 3},  {"ILL", 4},  {"TRAP", 5},
        {"ABRT", 6},  {"BUS", 7},   {"FPE", 8},   {"KILL", 9}, {"USR1", 10},
        {"SEGV", 11}, {"USR2", 12}, {"PIPE", 13}, {"ALRM", 14}, {"TERM", 15},
    };
    std::string name = signal_name;
    if (name.compare(0, 3, "SIG") == 0) name.erase(0, 3);
    auto it = signals.find(name);
    if (it == signals.end()) return 255;
    return 128 + it->second;
}
