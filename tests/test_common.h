#pragma once

#include <sys/stat.h>
#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

inline void die(const std::string& msg) {
    std::cerr << "TEST FAIL: " << msg << std::endl;
    std::exit(1);
}

inline void expect_true(bool cond, const std::string& msg) {
    if (!cond) die(msg);
}

inline void expect_eq_ll(long long a, long long b, const std::string& msg) {
    if (a != b) {
        die(msg + " (got=" + std::to_string(a) + ", want=" + std::to_string(b) + ")");
    }
}

inline void expect_eq_str(const std::string& a, const std::string& b, const std::string& msg) {
    if (a != b) {
        die(msg + " (got=\"" + a + "\", want=\"" + b + "\")");
    }
}

// Fresh directory under $TMPDIR (or /tmp), removed by the caller.
inline std::filesystem::path make_temp_dir(const std::string& prefix) {
    const char* base = std::getenv("TMPDIR");
    std::string tmpl = std::string(base && *base ? base : "/tmp") + "/" + prefix + "_XXXXXX";
    if (!mkdtemp(&tmpl[0])) die("mkdtemp failed for " + tmpl);
    return std::filesystem::path(tmpl);
}

inline void write_file(const std::filesystem::path& p, const std::string& body) {
    std::ofstream f(p.string(), std::ios::binary | std::ios::trunc);
    if (!f) die("cannot write " + p.string());
    f << body;
}

inline std::string read_file(const std::filesystem::path& p) {
    std::ifstream f(p.string(), std::ios::binary);
    std::ostringstream oss;
    oss << f.rdbuf();
    return oss.str();
}

// Executable /bin/sh script standing in for the external agent binary.
inline std::filesystem::path write_script(const std::filesystem::path& p, const std::string& body) {
    write_file(p, "#!/bin/sh\n" + body + "\n");
    if (::chmod(p.c_str(), 0755) != 0) die("chmod failed for " + p.string());
    return p;
}

inline void remove_tree(const std::filesystem::path& p) {
    std::error_code ec;
    std::filesystem::remove_all(p, ec);
}
