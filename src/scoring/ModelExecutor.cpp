#include "shieldcore/scoring/ModelExecutor.hpp"

#include <algorithm>
#include <iostream>
#include <thread>

namespace shieldcore {

ModelExecutor::ModelExecutor(const ModelRegistry& models, size_t threads)
    : pool_(std::make_shared<boost::asio::thread_pool>(
          std::max<size_t>({threads, models.size(), 1}))) {
    lanes_.reserve(models.size());
    for (const auto& r : models.models()) {
        auto lane = std::make_shared<Lane>();
        lane->model = r.model;
        lanes_.push_back(std::move(lane));
    }
}

ModelExecutor::~ModelExecutor() {
    const size_t running = in_flight();
    if (running == 0) {
        pool_->join();
        return;
    }
    std::cerr << "[SCORER] " << running << " model call(s) still running at shutdown\n";
    std::thread([pool = pool_]() { pool->join(); }).detach();
}

size_t ModelExecutor::in_flight() const {
    size_t n = 0;
    for (const auto& l : lanes_) {
        if (l->busy.load(std::memory_order_acquire)) ++n;
    }
    return n;
}

} // namespace shieldcore
