#include "shieldcore/config/ConfigLoader.hpp"
#include "shieldcore/config/EngineConfig.hpp"
#include "shieldcore/core/Errors.hpp"
#include "shieldcore/io/EveFlowReader.hpp"
#include "shieldcore/io/QueryServer.hpp"
#include "shieldcore/io/SinkFactory.hpp"
#include "shieldcore/models/ModelRegistry.hpp"
#include "shieldcore/runtime/Pipeline.hpp"

#include <curl/curl.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>

using namespace shieldcore;

static std::atomic<bool> g_running{true};
static void on_signal(int) { g_running.store(false); }

static void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [config.ini] [--input <eve.json|->] [--follow]\n"
              << "  --input   Suricata eve.json flow log, '-' for stdin\n"
              << "  --follow  keep reading the input as it grows until SIGINT/SIGTERM\n";
}

// Submits one event, waiting out BUSY. A file source can afford to wait;
// the drop is only for live producers that cannot.
static void submit_blocking(Pipeline& p, const FlowEvent& ev) {
    while (g_running.load()) {
        IngestResult r = p.submit(ev);
        if (r != IngestResult::BUSY) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

static void pump(std::istream& in, Pipeline& p, bool follow) {
    auto handler = [&](const FlowEvent& ev) { submit_blocking(p, ev); };
    io::EveFlowReader::Stats total;
    do {
        auto st = io::EveFlowReader::read(in, handler);
        total.lines += st.lines;
        total.flows += st.flows;
        total.skipped += st.skipped;
        total.malformed += st.malformed;
        if (!follow) break;
        in.clear();
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    } while (g_running.load());

    std::cout << "[EVE] lines=" << total.lines << " flows=" << total.flows
              << " skipped=" << total.skipped << " malformed=" << total.malformed << "\n";
}

int main(int argc, char** argv) {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::string config_path = "config/shieldcore.ini";
    std::string input;
    bool follow = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--input") == 0 && i + 1 < argc) {
            input = argv[++i];
        } else if (std::strcmp(argv[i], "--follow") == 0) {
            follow = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            usage(argv[0]);
            return 0;
        } else if (argv[i][0] == '-') {
            usage(argv[0]);
            return 2;
        } else {
            config_path = argv[i];
        }
    }

    EngineConfig cfg;
    std::unique_ptr<Pipeline> pipeline;
    try {
        ConfigLoader loader;
        loader.load(config_path);
        loader.dump();

        cfg = load_engine_config(loader);
        pipeline = std::make_unique<Pipeline>(cfg, ModelRegistry::from_config(cfg.scoring));
        io::register_sinks(cfg.dispatch, pipeline->dispatcher());
    } catch (const ConfigError& e) {
        std::cerr << "[CONFIG] FATAL: " << e.what() << "\n";
        return 1;
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "[MAIN] curl_global_init failed, webhook sinks will not deliver\n";
    }
    pipeline->start();

    std::unique_ptr<io::QueryServer> server;
    if (cfg.query.port > 0) {
        server = std::make_unique<io::QueryServer>(cfg.query, *pipeline);
        server->start();
    }

    if (input == "-") {
        pump(std::cin, *pipeline, follow);
    } else if (!input.empty()) {
        std::ifstream f(input);
        if (!f) {
            std::cerr << "[EVE] cannot open " << input << "\n";
        } else {
            pump(f, *pipeline, follow);
        }
    }

    // Without a finite input the daemon serves until signalled.
    if (input.empty() || follow) {
        while (g_running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }

    if (server) server->stop();
    pipeline->stop();
    curl_global_cleanup();
    return 0;
}
