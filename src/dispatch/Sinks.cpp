#include "shieldcore/dispatch/Sinks.hpp"
#include "shieldcore/core/Errors.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace shieldcore {

LogFileSink::LogFileSink(std::string id, std::string path)
    : id_(std::move(id)), path_(std::move(path)) {
    const auto dir = std::filesystem::path(path_).parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            std::cerr << "[DISPATCH] " << id_ << ": cannot create " << dir.string()
                      << ": " << ec.message() << "\n";
        }
    }
}

void LogFileSink::append(const std::string& line) {
    std::lock_guard<std::mutex> lk(mtx_);
    std::ofstream f(path_, std::ios::app);
    if (!f) throw DispatchFailure(id_ + ": cannot open " + path_);
    f << line << "\n";
    f.flush();
    if (!f) throw DispatchFailure(id_ + ": write failed on " + path_);
}

void LogFileSink::deliver(const MitigationAction& a) {
    append(to_csv(a));
}

void LogFileSink::deliver(const AlertEvent& a) {
    append(to_csv(a));
}

MemorySink::MemorySink(std::string id) : id_(std::move(id)) {}

void MemorySink::deliver(const MitigationAction& a) {
    std::lock_guard<std::mutex> lk(mtx_);
    actions_.push_back(a);
}

void MemorySink::deliver(const AlertEvent& a) {
    std::lock_guard<std::mutex> lk(mtx_);
    alerts_.push_back(a);
}

std::vector<MitigationAction> MemorySink::actions() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return actions_;
}

std::vector<AlertEvent> MemorySink::alerts() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return alerts_;
}

void MemorySink::clear() {
    std::lock_guard<std::mutex> lk(mtx_);
    actions_.clear();
    alerts_.clear();
}

} // namespace shieldcore
