#include "config.hpp"
#include <fstream>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

void from_json(const nlohmann::json &j, engine_config &config) {
    if (j.count("run_dir")) config.run_dir = j.at("run_dir").get<string>();
    if (j.count("workers")) j.at("workers").get_to(config.workers);
    if (j.count("queue_capacity")) j.at("queue_capacity").get_to(config.queue_capacity);
    if (j.count("output_limit_kb")) j.at("output_limit_kb").get_to(config.output_limit_kb);
    if (j.count("default_time_limit_sec")) j.at("default_time_limit_sec").get_to(config.default_time_limit_sec);
    if (j.count("max_time_limit_sec")) j.at("max_time_limit_sec").get_to(config.max_time_limit_sec);
    if (j.count("default_memory_limit_mb")) j.at("default_memory_limit_mb").get_to(config.default_memory_limit_mb);
    if (j.count("max_memory_limit_mb")) j.at("max_memory_limit_mb").get_to(config.max_memory_limit_mb);
    if (j.count("source_limit_kb")) j.at("source_limit_kb").get_to(config.source_limit_kb);
    if (j.count("proc_limit")) j.at("proc_limit").get_to(config.proc_limit);
    if (j.count("file_limit_kb")) j.at("file_limit_kb").get_to(config.file_limit_kb);
    if (j.count("isolate_network")) j.at("isolate_network").get_to(config.isolate_network);
    if (j.count("require_network_isolation")) j.at("require_network_isolation").get_to(config.require_network_isolation);
    if (j.count("path")) j.at("path").get_to(config.path);
    if (j.count("languages")) config.languages = j.at("languages");
    if (j.count("problems_dir")) config.problems_dir = j.at("problems_dir").get<string>();
    if (j.count("debug")) j.at("debug").get_to(config.debug);

    if (!(config.default_time_limit_sec > 0) || !(config.max_time_limit_sec > 0))
        throw invalid_request("time limits must be positive");
    if (config.default_memory_limit_mb <= 0 || config.max_memory_limit_mb <= 0)
        throw invalid_request("memory limits must be positive");
    if (config.source_limit_kb == 0)
        throw invalid_request("source_limit_kb must be positive");

    if (config.default_time_limit_sec > config.max_time_limit_sec)
        config.default_time_limit_sec = config.max_time_limit_sec;
    if (config.default_memory_limit_mb > config.max_memory_limit_mb)
        config.default_memory_limit_mb = config.max_memory_limit_mb;
}

engine_config load_config(const filesystem::path &path) {
    ifstream fin(path);
    if (!fin) throw invalid_request("Unable to open configuration file " + path.string());
    try {
        return nlohmann::json::parse(fin).get<engine_config>();
    } catch (nlohmann::json::exception &ex) {
        throw invalid_request("Malformed configuration file " + path.string() + ": " + ex.what());
    }
}

sandbox::execution_context make_execution_context(const engine_config &config) {
    sandbox::execution_context ctx;
    ctx.scratch_root = config.run_dir;
    ctx.isolate_network = config.isolate_network;
    ctx.require_network_isolation = config.require_network_isolation;
    ctx.output_limit = config.output_limit_kb * 1024;
    ctx.proc_limit = config.proc_limit;
    ctx.file_limit = config.file_limit_kb;
    ctx.search_path = config.path;
    ctx.keep_scratch = config.debug;
    return ctx;
}

}  // namespace grader
