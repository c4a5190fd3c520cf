// File: examples/protocol/filereader.cpp
// Purpose: Play local files through a custom "filereader://" stream protocol.
// Key invariants: Every stream opened by libmpv is closed through the protocol.
// Ownership/Lifetime: The Mpv object owns the protocol for its whole lifetime.
// Links: docs/coverage.md

#include "mpvbind/Client.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>

namespace
{
constexpr std::string_view kPrefix = "filereader://";

std::ifstream openFile(const std::string &uri)
{
    const std::string path = uri.substr(kPrefix.size());
    std::ifstream file(path, std::ios::binary);
    if (!file)
        throw std::runtime_error("cannot open " + path);
    std::cout << "Opened file[" << path << "]\n";
    return file;
}

void closeFile(std::ifstream &file)
{
    std::cout << "Closing file\n";
    file.close();
}

int64_t readFile(std::ifstream &file, char *buf, uint64_t nbytes)
{
    file.read(buf, static_cast<std::streamsize>(nbytes));
    if (file.bad())
        return -1;
    const auto got = file.gcount();
    file.clear();
    return got;
}

int64_t seekFile(std::ifstream &file, int64_t offset)
{
    std::cout << "Seeking to byte " << offset << "\n";
    file.clear();
    file.seekg(offset);
    if (!file)
        return MPV_ERROR_GENERIC;
    return offset;
}

int64_t sizeFile(std::ifstream &file)
{
    const auto here = file.tellg();
    file.seekg(0, std::ios::end);
    const auto end = file.tellg();
    file.seekg(here);
    return static_cast<int64_t>(end);
}

bool report(const mpvbind::support::Expected<void> &result)
{
    if (!result)
        mpvbind::support::printDiag(result.error(), std::cerr);
    return static_cast<bool>(result);
}
} // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        std::cerr << "usage: filereader <media-file>...\n";
        return 1;
    }

    auto created = mpvbind::client::Mpv::create();
    if (!created)
    {
        mpvbind::support::printDiag(created.error(), std::cerr);
        return 1;
    }
    mpvbind::client::Mpv &mpv = created.value();

    if (!report(mpv.setProperty("volume", 25)))
        return 1;

    auto protocol = std::make_unique<mpvbind::client::Protocol<std::ifstream>>(
        "filereader", openFile, closeFile, readFile, seekFile, sizeFile);
    if (!report(mpv.registerProtocol(std::move(protocol))))
        return 1;

    for (int i = 1; i < argc; ++i)
    {
        const char *mode = i == 1 ? "append-play" : "append";
        if (!report(mpv.command("loadfile", {std::string(kPrefix) + argv[i], mode})))
            return 1;
    }

    std::this_thread::sleep_for(std::chrono::seconds(10));
    if (!report(mpv.command("seek", {"15"})))
        return 1;
    std::this_thread::sleep_for(std::chrono::seconds(5));
    return 0;
}
