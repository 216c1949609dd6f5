#include "core/ArgumentParser.h"
#include "core/ConfigValidator.h"
#include "core/JSONWriter.h"
#include "core/Logging.h"
#include "core/Report.h"
#include "core/ScanOrchestrator.h"
#include "bacnet/RecordedApplication.h"
#include "graph/DiffWorkerPool.h"
#include "graph/GraphSerializer.h"
#include "graph/SnapshotStore.h"
#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace bacnet_scan;

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int){ g_stop.store(true); }

bool write_text(const std::string& path, const std::string& text){
    if(path == "-"){ std::cout << text; if(text.empty() || text.back() != '\n') std::cout << "\n"; return true; }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if(!out){ Logger::instance().error("cannot write " + path); return false; }
    out << text;
    return static_cast<bool>(out);
}

int run_scan(const Config& cfg){
    SnapshotStore store(cfg.snapshot_dir, cfg.store_limit);
    std::optional<TopologyGraph> prior;
    if(cfg.use_prior) prior = store.load_latest();

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    Report report;
    ScanOrchestrator orchestrator(cfg, make_recorded_application);
    TopologyGraph graph;
    try {
        graph = orchestrator.run(report, prior ? &*prior : nullptr, &g_stop);
    } catch(const ScanSetupError& ex){
        Logger::instance().error(std::string("scan setup failed: ") + ex.what());
        return 3;
    }
    if(g_stop.load()) Logger::instance().warn("scan interrupted; storing partial graph");

    try {
        store.save(graph, std::chrono::system_clock::now());
        if(!cfg.output_file.empty()) ntriples::save_file(cfg.output_file, graph.to_triples());
    } catch(const std::exception& ex){
        Logger::instance().error(std::string("cannot store scan: ") + ex.what());
        return 1;
    }
    if(!cfg.json_output.empty()){
        JSONWriter writer;
        if(!write_text(cfg.json_output, writer.write(report, graph, cfg))) return 1;
    }
    return report.errors().empty() ? 0 : 1;
}

// Two explicit snapshots, or the two newest in the store.
bool diff_inputs(const Config& cfg, const std::vector<std::string>& args, std::string& a, std::string& b){
    if(args.size() == 2){ a = args[0]; b = args[1]; return true; }
    if(!args.empty()){ std::cerr << "diff needs two snapshots (or none for the two newest)\n"; return false; }
    auto all = SnapshotStore(cfg.snapshot_dir, 0).list();
    if(all.size() < 2){ std::cerr << "fewer than two snapshots in " << cfg.snapshot_dir << "\n"; return false; }
    a = all[1].string(); b = all[0].string();
    return true;
}

int run_diff(const Config& cfg, const std::vector<std::string>& args){
    std::string a, b;
    if(!diff_inputs(cfg, args, a, b)) return 2;
    DiffTask task;
    task.path_a = a;
    task.path_b = b;
    task.output_dir = cfg.diff_output_dir.empty() ? std::filesystem::path(a).parent_path().string() : cfg.diff_output_dir;
    if(task.output_dir.empty()) task.output_dir = ".";

    DiffWorkerPool pool(static_cast<size_t>(cfg.diff_workers));
    auto fut = pool.submit(task);
    DiffOutcome outcome = fut.get();
    pool.shutdown();
    if(!outcome.ok){
        Logger::instance().error("diff failed: " + outcome.error);
        return 1;
    }
    std::cout << "in_both=" << outcome.result.in_both.size()
              << " only_in_a=" << outcome.result.only_in_a.size()
              << " only_in_b=" << outcome.result.only_in_b.size()
              << " merged=" << outcome.output_path << "\n";
    if(!cfg.json_output.empty()){
        JSONWriter writer;
        if(!write_text(cfg.json_output, writer.write_diff(outcome.result, a, b, cfg))) return 1;
    }
    return 0;
}

int run_export(const Config& cfg, const std::vector<std::string>& args){
    std::string path;
    if(args.size() == 1) path = args[0];
    else if(args.empty()){
        auto all = SnapshotStore(cfg.snapshot_dir, 0).list();
        if(all.empty()){ std::cerr << "no snapshot in " << cfg.snapshot_dir << "\n"; return 2; }
        path = all.front().string();
    } else { std::cerr << "export takes one snapshot\n"; return 2; }
    try {
        TopologyGraph graph = ntriples::load_graph(path);
        JSONWriter writer;
        return write_text(cfg.json_output.empty() ? "-" : cfg.json_output, writer.write_graph(graph, cfg)) ? 0 : 1;
    } catch(const GraphParseError& ex){
        Logger::instance().error(path + ": " + ex.what());
        return 1;
    }
}

}

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    Config cfg;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)) return parser.exit_code();
    if(!ConfigValidator::validate(cfg)) return 2;
    LogLevel lvl = LogLevel::Info;
    if(parse_log_level(cfg.log_level, lvl)) Logger::instance().set_level(lvl);

    if(parser.command() == "diff") return run_diff(cfg, parser.positional());
    if(parser.command() == "export") return run_export(cfg, parser.positional());
    if(!parser.positional().empty()){
        std::cerr << "scan takes no positional arguments\n";
        return 2;
    }
    return run_scan(cfg);
}
