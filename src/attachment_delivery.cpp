#include "attachment_delivery.hpp"
#include "util.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace onthisday {

static constexpr size_t kMaxProcessOutput = 10000;

ProcessResult run_process(const std::vector<std::string>& argv, int timeout_ms) {
    ProcessResult result;
    if (argv.empty()) return result;

    int out_pipe[2];
    if (pipe(out_pipe) != 0) return result;

    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        return result;
    }

    if (pid == 0) {
        close(out_pipe[0]);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        close(out_pipe[1]);

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
        args.push_back(nullptr);
        execvp(args[0], args.data());
        _exit(127);
    }

    close(out_pipe[1]);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::array<char, 4096> buffer;
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            result.timed_out = true;
            break;
        }

        struct pollfd pfd;
        pfd.fd = out_pipe[0];
        pfd.events = POLLIN;
        int ret = poll(&pfd, 1, static_cast<int>(remaining));
        if (ret < 0) break;
        if (ret == 0) continue;  // deadline check above

        if ((pfd.revents & POLLIN) != 0) {
            ssize_t n = read(out_pipe[0], buffer.data(), buffer.size());
            if (n > 0) {
                if (result.output.size() < kMaxProcessOutput) {
                    result.output.append(buffer.data(), static_cast<size_t>(n));
                }
                continue;
            }
            break;  // EOF
        }
        if ((pfd.revents & (POLLHUP | POLLERR)) != 0) break;
    }
    close(out_pipe[0]);

    // Closed output does not mean the child is gone; the deadline still holds.
    int status = 0;
    bool reaped = false;
    while (!result.timed_out) {
        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid) {
            reaped = true;
            break;
        }
        if (ret < 0 && errno != EINTR) return result;
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }
        poll(nullptr, 0, 10);
    }
    if (!reaped) {
        kill(pid, SIGKILL);
        if (waitpid(pid, &status, 0) < 0) return result;
    }
    if (!result.timed_out && WIFEXITED(status)) {
        result.exited = true;
        result.exit_code = WEXITSTATUS(status);
    }
    return result;
}

bool is_heic(const std::string& path, const std::optional<std::string>& mime_type) {
    if (mime_type && to_lower(*mime_type).find("heic") != std::string::npos) return true;
    return ends_with(to_lower(path), ".heic");
}

std::optional<std::string> convert_heic_to_jpeg(const std::string& source, int64_t attachment_id,
                                                const AttachmentConfig& cfg) {
    namespace fs = std::filesystem;
    std::error_code ec;

    fs::path cache_dir = cfg.effective_cache_dir();
    fs::path out_path = cache_dir / (std::to_string(attachment_id) + ".jpg");
    if (fs::exists(out_path, ec)) return out_path.string();

    fs::create_directories(cache_dir, ec);
    if (ec) {
        std::cerr << "[attachments] Cannot create cache dir " << cache_dir.string()
                  << ": " << ec.message() << "\n";
        return std::nullopt;
    }

    auto result = run_process({"sips", "-s", "format", "jpeg", source, "--out", out_path.string()},
                              cfg.convert_timeout_ms());
    if (result.exited && result.exit_code == 0 && fs::exists(out_path, ec)) {
        return out_path.string();
    }

    if (result.timed_out) {
        std::cerr << "[attachments] HEIC conversion timed out for " << attachment_id << "\n";
    } else {
        std::cerr << "[attachments] HEIC conversion failed for " << attachment_id
                  << " (exit " << result.exit_code << ")\n";
    }
    fs::remove(out_path, ec);  // never leave a partial file to be reused
    return std::nullopt;
}

DeliveredAttachment prepare_attachment(const AttachmentFile& file, int64_t attachment_id,
                                       const AttachmentConfig& cfg) {
    if (cfg.convert_heic && is_heic(file.path, file.mime_type)) {
        if (auto converted = convert_heic_to_jpeg(file.path, attachment_id, cfg)) {
            return DeliveredAttachment{*converted, "image/jpeg", true};
        }
    }
    return DeliveredAttachment{file.path, file.mime_type.value_or("application/octet-stream"), false};
}

} // namespace onthisday
