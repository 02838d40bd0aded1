#include "hive/mailbox.h"
#include "hive/file_lock.h"
#include "hive/json_util.h"
#include "hive/log.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace hive {

static const char* kComponent = "mailbox";

static std::filesystem::path lock_for(const std::filesystem::path& log) {
    auto p = log;
    p += ".lock";
    return p;
}

Mailbox::Mailbox(std::filesystem::path dir, Clock clock) : dir_(std::move(dir)), clock_(std::move(clock)) {}

std::filesystem::path Mailbox::log_path(const std::string& id) const {
    return dir_ / (id + ".jsonl");
}

std::string Mailbox::send(const std::string& to, const std::string& content,
                          const std::string& type, const std::string& from) {
    if (to.empty() || to.find('/') != std::string::npos) return "invalid recipient id";

    json::Doc d = json::new_object();
    json::put_string(d.root, "from", from);
    json::put_string(d.root, "type", type);
    json::put_string(d.root, "content", content);
    json::put_int(d.root, "ts", clock_());
    std::string line = json::dump(d.root) + "\n";

    const auto path = log_path(to);
    ScopedFileLock lock(lock_for(path), kComponent);

    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) return std::string("open: ") + std::strerror(errno);

    size_t off = 0;
    while (off < line.size()) {
        ssize_t w = ::write(fd, line.data() + off, line.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            std::string err = std::string("write: ") + std::strerror(errno);
            ::close(fd);
            return err;
        }
        off += static_cast<size_t>(w);
    }
    ::close(fd);
    return "";
}

std::vector<MailboxMessage> Mailbox::read_and_drain(const std::string& id) {
    std::vector<MailboxMessage> out;
    const auto path = log_path(id);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return out;

    ScopedFileLock lock(lock_for(path), kComponent);

    std::ifstream f(path);
    if (!f) return out;
    std::string line;
    size_t lineno = 0;
    while (std::getline(f, line)) {
        lineno++;
        if (line.empty()) continue;
        json::Doc d = json::parse(line);
        if (!d || !json::is_object(d.root)) {
            log_warn(kComponent, "dropping malformed line " + std::to_string(lineno) + " in " + path.filename().string());
            continue;
        }
        MailboxMessage m;
        m.from = json::get_string(d.root, "from");
        m.type = json::get_string(d.root, "type", kMsgText);
        m.content = json::get_string(d.root, "content");
        m.ts = json::get_int(d.root, "ts");
        out.push_back(std::move(m));
    }
    f.close();

    std::filesystem::resize_file(path, 0, ec);
    if (ec) log_warn(kComponent, "truncate " + path.string() + ": " + ec.message());
    return out;
}

size_t Mailbox::peek_count(const std::string& id) const {
    std::ifstream f(log_path(id));
    size_t n = 0;
    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty()) n++;
    }
    return n;
}

} // namespace hive
