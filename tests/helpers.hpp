#pragma once

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

#include "pack/cipher.hpp"

namespace testutil {

// mkdtemp directory removed with its contents on scope exit
class TempDir
{
public:
    TempDir()
    {
        const char* base = std::getenv("TMPDIR");
        std::string tmpl = std::string(base ? base : "/tmp") + "/offpack-test-XXXXXX";
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data())) path_ = buf.data();
    }

    ~TempDir()
    {
        if (!path_.empty())
            nftw(path_.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string operator/(const std::string& name) const { return path_ + "/" + name; }

private:
    static int remove_entry(const char* p, const struct stat*, int, struct FTW*)
    {
        return ::remove(p);
    }

    std::string path_;
};

// Sparse file of the given size
inline bool make_sized_file(const std::string& path, off_t size)
{
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd == -1) return false;
    bool ok = ftruncate(fd, size) == 0;
    close(fd);
    return ok;
}

inline std::vector<uint8_t> pattern(size_t n, uint32_t seed = 1)
{
    std::vector<uint8_t> v(n);
    uint32_t x = seed;
    for (size_t i = 0; i < n; i++)
    {
        x = x * 1664525u + 1013904223u;
        v[i] = static_cast<uint8_t>(x >> 24);
    }
    return v;
}

inline bool write_file(const std::string& path, const void* data, size_t n)
{
    FILE* f = std::fopen(path.c_str(), "wb");
    if (!f) return false;
    bool ok = std::fwrite(data, 1, n, f) == n;
    return (std::fclose(f) == 0) && ok;
}

inline bool write_file(const std::string& path, const std::string& s)
{
    return write_file(path, s.data(), s.size());
}

inline std::string read_file(const std::string& path)
{
    std::string out;
    FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) return out;
    char buf[4096];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) out.append(buf, n);
    std::fclose(f);
    return out;
}

inline bool exists(const std::string& path)
{
    struct stat st{};
    return lstat(path.c_str(), &st) == 0;
}

// Number of entries in a directory, '.' and '..' excluded
inline int count_entries(const std::string& dir)
{
    DIR* d = opendir(dir.c_str());
    if (!d) return -1;
    int n = 0;
    while (struct dirent* e = readdir(d))
    {
        std::string name = e->d_name;
        if (name != "." && name != "..") n++;
    }
    closedir(d);
    return n;
}

struct Call {
    std::string source;
    std::string dest;
    uint64_t offset;
    uint64_t length;
    std::string pass_file;
};

// Records every request; fails the calls whose index is listed
class RecordingCipher : public pack::PartCipher
{
public:
    const char* suffix() const override { return ".gpg"; }

    int encrypt(const std::string& source, const std::string& dest,
                uint64_t offset, uint64_t length,
                const std::string& pass_file) override
    {
        int idx = static_cast<int>(calls.size());
        calls.push_back(Call{source, dest, offset, length, pass_file});
        for (int f : fail_on)
            if (f == idx) return -EIO;
        return 0;
    }

    std::vector<Call> calls;
    std::vector<int> fail_on;
};

}
