#include "keymap_file.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>

static std::string os_error() {
    return errno ? std::strerror(errno) : "I/O error";
}

Bytes read_keymap_file(const std::string& path) {
    errno = 0;
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open())
        throw std::runtime_error("Cannot open keymap file " + path + ": " + os_error());

    Bytes data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad())
        throw std::runtime_error("Cannot read keymap file " + path + ": " + os_error());
    return data;
}

void write_keymap_file(const std::string& path, const Bytes& keymap) {
    errno = 0;
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open())
        throw std::runtime_error("Cannot create keymap file " + path + ": " + os_error());

    f.write(reinterpret_cast<const char*>(keymap.data()),
            static_cast<std::streamsize>(keymap.size()));
    f.flush();
    if (!f)
        throw std::runtime_error("Cannot write keymap file " + path + ": " + os_error());
}
