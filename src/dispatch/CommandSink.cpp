#include "shieldcore/dispatch/CommandSink.hpp"
#include "shieldcore/core/Errors.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <sstream>
#include <thread>

#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>

extern char** environ;

namespace shieldcore {
namespace {

std::vector<std::string> split_words(const std::string& line) {
    std::vector<std::string> out;
    std::istringstream in(line);
    std::string w;
    while (in >> w) out.push_back(w);
    return out;
}

std::string substitute(std::string arg, const std::string& ip) {
    static const std::string kPlaceholder = "{ip}";
    size_t pos = 0;
    while ((pos = arg.find(kPlaceholder, pos)) != std::string::npos) {
        arg.replace(pos, kPlaceholder.size(), ip);
        pos += ip.size();
    }
    return arg;
}

std::string join(const std::vector<std::string>& argv) {
    std::string s;
    for (const auto& a : argv) {
        if (!s.empty()) s += ' ';
        s += a;
    }
    return s;
}

} // namespace

CommandSink::CommandSink(std::string id, const std::string& block_cmd,
                         const std::string& unblock_cmd, uint64_t timeout_ms)
    : id_(std::move(id)), block_(split_words(block_cmd)), unblock_(split_words(unblock_cmd)),
      timeout_ms_(timeout_ms) {
    if (block_.empty()) throw ConfigError("[sink." + id_ + "] empty block command");
    if (unblock_.empty()) throw ConfigError("[sink." + id_ + "] empty unblock command");
}

std::vector<std::string> CommandSink::argv_for(ActionKind kind, const std::string& ip) const {
    const std::vector<std::string>* tmpl = nullptr;
    if (kind == ActionKind::BLOCK) tmpl = &block_;
    else if (kind == ActionKind::UNBLOCK) tmpl = &unblock_;
    if (!tmpl) return {};

    std::vector<std::string> argv;
    argv.reserve(tmpl->size());
    for (const auto& a : *tmpl) argv.push_back(substitute(a, ip));
    return argv;
}

void CommandSink::deliver(const MitigationAction& a) {
    const auto argv = argv_for(a.kind, a.source.ip);
    if (argv.empty()) return;
    run(argv);
    std::cout << "[DISPATCH] " << id_ << " ran: " << join(argv) << "\n";
}

void CommandSink::run(const std::vector<std::string>& argv) const {
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = 0;
    const int rc = ::posix_spawnp(&pid, cargv[0], nullptr, nullptr, cargv.data(), environ);
    if (rc != 0) {
        throw DispatchFailure(id_ + ": cannot run " + argv[0] + ": " + std::strerror(rc));
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);
    int status = 0;
    for (;;) {
        const pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0 && errno != EINTR) {
            throw DispatchFailure(id_ + ": waitpid failed: " + std::strerror(errno));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
            throw DispatchFailure(id_ + ": " + argv[0] + " timed out after " +
                                  std::to_string(timeout_ms_) + "ms");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) return;
    if (WIFEXITED(status)) {
        // some libcs report a binary that could not be executed as status 127
        throw DispatchFailure(id_ + ": " + join(argv) + " exited with " +
                              std::to_string(WEXITSTATUS(status)));
    }
    throw DispatchFailure(id_ + ": " + join(argv) + " killed by signal " +
                          std::to_string(WTERMSIG(status)));
}

} // namespace shieldcore
