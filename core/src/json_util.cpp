#include "hive/json_util.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace hive::json {

bool read_text_file(const std::filesystem::path& p, std::string* out) {
    std::ifstream f(p, std::ios::binary);
    if (!f) return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    if (out) *out = ss.str();
    return true;
}

std::string write_atomic(const std::filesystem::path& dst, const std::string& body) {
    std::error_code ec;
    if (dst.has_parent_path()) std::filesystem::create_directories(dst.parent_path(), ec);

    auto tmp = dst;
    tmp += ".tmp";
    int fd = ::open(tmp.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if (fd < 0) return std::string("open tmp: ") + std::strerror(errno);

    const char* p = body.data();
    size_t off = 0;
    while (off < body.size()) {
        ssize_t w = ::write(fd, p + off, body.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            std::string err = std::string("write: ") + std::strerror(errno);
            ::close(fd);
            std::filesystem::remove(tmp, ec);
            return err;
        }
        off += static_cast<size_t>(w);
    }
    if (::fsync(fd) != 0) {
        std::string err = std::string("fsync: ") + std::strerror(errno);
        ::close(fd);
        std::filesystem::remove(tmp, ec);
        return err;
    }
    ::close(fd);

    std::filesystem::rename(tmp, dst, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return "rename failed";
    }
    return "";
}

Doc load_file(const std::filesystem::path& p, bool* missing) {
    std::string body;
    if (!read_text_file(p, &body) || body.empty()) {
        if (missing) *missing = true;
        return Doc{};
    }
    if (missing) *missing = false;
    return parse(body);
}

} // namespace hive::json
