/*
    bft - A brainfuck tape interpreter
    Source file loading
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "source.hxx"

#include <cstddef>
#include <fstream>
#include <string>
#include <utility>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace {
// Cross-platform read-only file mapping
struct MappedFile {
    const char* data = nullptr;
    size_t size = 0;
#ifdef _WIN32
    HANDLE hFile = INVALID_HANDLE_VALUE;
    HANDLE hMap = nullptr;
#else
    int fd = -1;
#endif
    MappedFile() = default;
    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;
    ~MappedFile() { close(); }
    void close() {
#ifdef _WIN32
        if (data) UnmapViewOfFile((LPCVOID)data);
        if (hMap) CloseHandle(hMap);
        if (hFile != INVALID_HANDLE_VALUE) CloseHandle(hFile);
        hMap = nullptr;
        hFile = INVALID_HANDLE_VALUE;
#else
        if (data && size) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
            munmap(const_cast<char*>(data), size);
        }
        if (fd >= 0) ::close(fd);
        fd = -1;
#endif
        data = nullptr;
        size = 0;
    }
};

bool mapFileReadOnly(const std::string& path, MappedFile& mf) {
#ifdef _WIN32
    HANDLE file = CreateFileA(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING,
                              FILE_ATTRIBUTE_NORMAL | FILE_FLAG_SEQUENTIAL_SCAN, nullptr);
    if (file == INVALID_HANDLE_VALUE) return false;
    LARGE_INTEGER sz{};
    if (!GetFileSizeEx(file, &sz)) {
        CloseHandle(file);
        return false;
    }
    mf.hFile = file;
    if (sz.QuadPart == 0) return true;
    HANDLE map = CreateFileMappingW(file, nullptr, PAGE_READONLY, 0, 0, nullptr);
    if (!map) return false;
    mf.hMap = map;
    void* view = MapViewOfFile(map, FILE_MAP_READ, 0, 0, 0);
    if (!view) return false;
    mf.data = static_cast<const char*>(view);
    mf.size = static_cast<size_t>(sz.QuadPart);
    return true;
#else
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) return false;
    mf.fd = fd;
    struct stat st{};
    if (fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) return false;
    if (st.st_size == 0) return true;
    void* view = mmap(nullptr, static_cast<size_t>(st.st_size), PROT_READ, MAP_PRIVATE, fd, 0);
    if (view == MAP_FAILED) return false;
    mf.data = static_cast<const char*>(view);
    mf.size = static_cast<size_t>(st.st_size);
    return true;
#endif
}
}  // namespace

bool bft::readSourceFile(const std::string& filename, std::string& out, std::string& err) {
    {
        MappedFile mf;
        if (mapFileReadOnly(filename, mf)) {
            if (mf.size == 0 || mf.data == nullptr) {
                out.clear();
            } else {
                out.assign(mf.data, mf.size);
            }
            return true;
        }
    }
    // Fallback: stream the file when it cannot be mapped
    std::ifstream in(filename, std::ios::binary);
    if (!in.is_open()) {
        err = "File could not be opened: " + filename;
        return false;
    }
    std::string text;
    char c;
    while (in.get(c)) text.push_back(c);
    if (!in.eof() && in.fail()) {
        err = "Error while reading file: " + filename;
        return false;
    }
    out.swap(text);
    return true;
}
