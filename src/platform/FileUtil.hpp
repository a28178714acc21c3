#pragma once

#include <cctype>
#include <cstdio>
#include <string>
#include <vector>

namespace gamevision {

inline bool readFileBytes(const std::string& path,
                          std::vector<unsigned char>& out, std::string* err) {
    std::FILE* file = std::fopen(path.c_str(), "rb");
    if (!file) {
        if (err) {
            *err = "failed to open file: " + path;
        }
        return false;
    }
    std::fseek(file, 0, SEEK_END);
    long size = std::ftell(file);
    if (size < 0) {
        std::fclose(file);
        if (err) {
            *err = "failed to stat file: " + path;
        }
        return false;
    }
    std::fseek(file, 0, SEEK_SET);
    out.resize(static_cast<size_t>(size));
    if (size > 0 && std::fread(out.data(), 1, static_cast<size_t>(size),
                               file) != static_cast<size_t>(size)) {
        std::fclose(file);
        if (err) {
            *err = "failed to read file: " + path;
        }
        return false;
    }
    std::fclose(file);
    return true;
}

// Reads a small text file whose size is not known up front (procfs entries
// report a size of zero).
inline bool readTextFile(const std::string& path, std::string& out) {
    std::FILE* file = std::fopen(path.c_str(), "rb");
    if (!file) {
        return false;
    }
    out.clear();
    char buf[512];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), file)) > 0) {
        out.append(buf, n);
    }
    std::fclose(file);
    return true;
}

inline bool writeFileBytes(const std::string& path, const void* data,
                           size_t size, std::string* err) {
    std::FILE* file = std::fopen(path.c_str(), "wb");
    if (!file) {
        if (err) {
            *err = "failed to create file: " + path;
        }
        return false;
    }
    bool ok = size == 0 || std::fwrite(data, 1, size, file) == size;
    ok = (std::fclose(file) == 0) && ok;
    if (!ok && err) {
        *err = "failed to write file: " + path;
    }
    return ok;
}

inline bool writeFileBytes(const std::string& path,
                           const std::vector<unsigned char>& bytes,
                           std::string* err) {
    return writeFileBytes(path, bytes.data(), bytes.size(), err);
}

inline bool writeTextFile(const std::string& path, const std::string& text,
                          std::string* err) {
    return writeFileBytes(path, text.data(), text.size(), err);
}

inline std::string toLowerAscii(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

inline std::string trimWhitespace(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end &&
           std::isspace(static_cast<unsigned char>(s[begin])) != 0) {
        ++begin;
    }
    while (end > begin &&
           std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return s.substr(begin, end - begin);
}

}  // namespace gamevision
