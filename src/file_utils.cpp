#include "file_utils.hpp"
#include "errors.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <string>

namespace FontGrep {

bool isFontFile(const std::filesystem::path& path) {
    static const std::array<const char*, 10> extensions = {
        ".ttf", ".otf", ".ttc", ".otc", ".woff", ".woff2", ".dfont", ".pfa", ".pfb", ".eot"
    };

    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

FileStamp readFileStamp(const std::filesystem::path& path) {
    std::error_code ec;
    auto modifiedTime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        throw IoError(path, ec.message());
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw IoError(path, ec.message());
    }

    FileStamp stamp;
    stamp.mtime = static_cast<int64_t>(modifiedTime.time_since_epoch().count());
    stamp.size = static_cast<int64_t>(size);
    return stamp;
}

std::vector<uint8_t> readFileBytes(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw IoError(path, "cannot open file");
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        throw IoError(path, "cannot determine file size");
    }
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> bytes(static_cast<size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(bytes.data()), size)) {
        throw IoError(path, "short read");
    }
    return bytes;
}

std::filesystem::path defaultCacheDirectory() {
    const char* dataHome = std::getenv("XDG_DATA_HOME");
    if (dataHome && *dataHome) {
        return std::filesystem::path(dataHome) / "fontgrep";
    }

    const char* home = std::getenv("HOME");
    if (home && *home) {
        return std::filesystem::path(home) / ".local" / "share" / "fontgrep";
    }

    return "/tmp/fontgrep";
}

} // namespace FontGrep
