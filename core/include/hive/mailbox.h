#pragma once

#include "hive/ids.h"
#include "hive/types.h"

#include <filesystem>
#include <string>
#include <vector>

namespace hive {

// Message types the core sends.
inline constexpr const char* kMsgReviewRequest = "review_request";
inline constexpr const char* kMsgShutdown = "shutdown";
inline constexpr const char* kMsgText = "message";

// Mailbox: per-recipient append-only JSONL logs under one directory.
//
//   <dir>/<id>.jsonl       one MailboxMessage per line, FIFO
//   <dir>/<id>.jsonl.lock  advisory lock shared by send and drain
//
// Delivery is at-least-once: a crash between read and truncate redelivers.
class Mailbox {
public:
    explicit Mailbox(std::filesystem::path dir, Clock clock = system_clock_ms());

    // Appends one message for `to`. Returns empty string on success.
    std::string send(const std::string& to, const std::string& content,
                     const std::string& type = kMsgText, const std::string& from = "system");

    // Returns every queued message for `id`, oldest first, and empties the log.
    // Lines that do not parse are dropped with a warning.
    std::vector<MailboxMessage> read_and_drain(const std::string& id);

    // Number of queued lines, without consuming them.
    size_t peek_count(const std::string& id) const;

    std::filesystem::path log_path(const std::string& id) const;

private:
    std::filesystem::path dir_;
    Clock clock_;
};

} // namespace hive
