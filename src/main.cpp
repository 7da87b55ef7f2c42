#include <glog/logging.h>
#include <signal.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <algorithm>
#include <deque>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <map>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/engine.hpp"
#include "translate/translator.hpp"
using namespace std;

namespace po = boost::program_options;

static void print_json(const nlohmann::json &j, bool pretty) {
    if (pretty)
        cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << endl;
    else
        cout << j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << endl;
}

/**
 * @brief 读取文件内容，"-" 表示标准输入
 */
static string read_input(const string &path) {
    if (path == "-") {
        return string((istreambuf_iterator<char>(cin)), istreambuf_iterator<char>());
    }
    return grader::read_file_content(path);
}

static grader::submission_request make_request(const po::variables_map &vm) {
    grader::submission_request request;
    if (!vm.count("code")) throw grader::invalid_request("--code is required");
    if (!vm.count("language")) throw grader::invalid_request("--language is required");
    request.code = read_input(vm.at("code").as<string>());
    request.language = vm.at("language").as<string>();
    if (vm.count("stdin")) request.stdin_data = read_input(vm.at("stdin").as<string>());
    if (vm.count("problem")) request.problem_id = vm.at("problem").as<string>();
    if (vm.count("time-limit")) request.time_limit_sec = vm.at("time-limit").as<double>();
    if (vm.count("memory-limit")) request.memory_limit_mb = vm.at("memory-limit").as<int>();
    return request;
}

static int command_run(grader::engine &engine, const po::variables_map &vm) {
    grader::submission_request request = make_request(vm);
    grader::execution_result result = engine.run_bare(request);
    print_json(result, true);
    return result.stat == grader::status::SUCCESS ? EXIT_SUCCESS : EXIT_FAILURE;
}

static int command_judge(grader::engine &engine, const po::variables_map &vm) {
    grader::submission_request request = make_request(vm);
    if (!request.problem_id) throw grader::invalid_request("--problem is required");
    grader::problem_spec problem = grader::load_problem(engine.config().problems_dir, *request.problem_id);
    grader::execution_result result = engine.run_graded(request, problem);
    print_json(result, true);
    return result.stat == grader::status::SUCCESS ? EXIT_SUCCESS : EXIT_FAILURE;
}

static int command_signature(grader::engine &engine, const po::variables_map &vm) {
    if (!vm.count("problem")) throw grader::invalid_request("--problem is required");
    grader::problem_spec problem = grader::load_problem(engine.config().problems_dir, vm.at("problem").as<string>());

    vector<string> languages;
    if (vm.count("language"))
        languages.push_back(vm.at("language").as<string>());
    else
        languages = problem.supported_languages;

    for (auto &name : languages) {
        const grader::translate::language_profile &language = engine.languages().get(name);
        if (languages.size() > 1) cout << "# " << language.name << endl;
        cout << grader::translate::render_signature(problem, language) << endl;
    }
    return EXIT_SUCCESS;
}

static int command_validate(grader::engine &engine, const po::variables_map &vm) {
    const filesystem::path &dir = engine.config().problems_dir;
    vector<string> ids;
    if (vm.count("problem")) {
        ids.push_back(vm.at("problem").as<string>());
    } else {
        if (!filesystem::is_directory(dir))
            throw grader::invalid_request("Problems directory " + dir.string() + " does not exist");
        for (auto &entry : filesystem::directory_iterator(dir))
            if (entry.is_regular_file() && entry.path().extension() == ".json")
                ids.push_back(entry.path().stem().string());
        sort(ids.begin(), ids.end());
    }

    int failed = 0;
    for (auto &id : ids) {
        try {
            grader::problem_spec problem = grader::load_problem(dir, id);
            grader::translate::validate(problem, engine.languages());
            cout << id << ": ok" << endl;
        } catch (grader::translation_error &ex) {
            cout << id << ": " << ex.reason() << ": " << ex.what() << endl;
            ++failed;
        } catch (grader::invalid_request &ex) {
            cout << id << ": invalid: " << ex.what() << endl;
            ++failed;
        } catch (nlohmann::json::exception &ex) {
            cout << id << ": malformed json: " << ex.what() << endl;
            ++failed;
        }
    }
    return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}

/**
 * @brief 从标准输入读取每行一个 JSON 请求，并发运行，按请求顺序输出结果
 * 评测队列已满时等待最早的请求完成后重试
 */
static int command_batch(grader::engine &engine, const po::variables_map &vm) {
    istream *in = &cin;
    ifstream fin;
    if (vm.count("input") && vm.at("input").as<string>() != "-") {
        fin.open(vm.at("input").as<string>());
        if (!fin) throw grader::invalid_request("Unable to open " + vm.at("input").as<string>());
        in = &fin;
    }

    map<string, shared_ptr<const grader::problem_spec>> problems;
    deque<future<grader::execution_result>> pending;

    auto flush_one = [&] {
        grader::execution_result result = pending.front().get();
        pending.pop_front();
        print_json(result, false);
    };

    auto submit = [&](const grader::submission_request &request) {
        if (!request.problem_id) return engine.submit_bare(request);
        auto &problem = problems[*request.problem_id];
        if (!problem)
            problem = make_shared<const grader::problem_spec>(grader::load_problem(engine.config().problems_dir, *request.problem_id));
        return engine.submit_graded(request, problem);
    };

    string line;
    size_t line_no = 0;
    while (getline(*in, line)) {
        ++line_no;
        if (grader::trim(line).empty()) continue;

        grader::submission_request request;
        try {
            request = nlohmann::json::parse(line).get<grader::submission_request>();
        } catch (nlohmann::json::exception &ex) {
            LOG(ERROR) << "Line " << line_no << " is not a valid request, " << ex.what();
            return EXIT_FAILURE;
        }

        while (true) {
            try {
                pending.push_back(submit(request));
                break;
            } catch (grader::system_busy &) {
                if (!pending.empty())
                    flush_one();
                else
                    this_thread::sleep_for(chrono::milliseconds(10));
            } catch (grader::invalid_request &ex) {
                // 保持输出顺序，先输出之前的结果
                while (!pending.empty()) flush_one();
                print_json({{"line", line_no}, {"error", ex.what()}}, false);
                break;
            }
        }
    }

    while (!pending.empty()) flush_one();
    return EXIT_SUCCESS;
}

static grader::engine_config load_engine_config(const po::variables_map &vm) {
    grader::engine_config config;
    if (vm.count("config")) config = grader::load_config(vm.at("config").as<string>());

    if (vm.count("run-dir")) {
        config.run_dir = vm.at("run-dir").as<string>();
    } else if (getenv("RUNDIR")) {
        config.run_dir = getenv("RUNDIR");
    }

    if (vm.count("workers")) {
        config.workers = vm.at("workers").as<size_t>();
    } else if (getenv("WORKERS")) {
        config.workers = boost::lexical_cast<size_t>(getenv("WORKERS"));
    }

    if (vm.count("queue-capacity")) config.queue_capacity = vm.at("queue-capacity").as<size_t>();
    if (vm.count("output-limit")) config.output_limit_kb = vm.at("output-limit").as<size_t>();
    if (vm.count("problems-dir")) config.problems_dir = vm.at("problems-dir").as<string>();
    if (vm.count("allow-network-fallback")) config.require_network_isolation = false;

    if (vm.count("debug") || getenv("DEBUG")) config.debug = true;
    return config;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    // 选手程序关闭管道时不能让评测服务退出
    signal(SIGPIPE, SIG_IGN);

    po::options_description desc("grader options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("command", po::value<string>(), "one of run, judge, signature, validate, batch")
        ("config", po::value<string>(), "load engine configuration from the given JSON file")
        ("code", po::value<string>(), "source file of the submission, - for standard input")
        ("language", po::value<string>(), "language of the submission, for example python, typescript, javascript")
        ("stdin", po::value<string>(), "file fed to the standard input of the submission")
        ("problem", po::value<string>(), "problem id, the problem is loaded from <problems-dir>/<id>.json")
        ("problems-dir", po::value<string>(), "set the directory storing problem definitions")
        ("time-limit", po::value<double>(), "override the time limit in seconds, never exceeding the limit of the problem")
        ("memory-limit", po::value<int>(), "override the memory limit in MB, never exceeding the limit of the problem")
        ("input", po::value<string>(), "file with newline-delimited JSON requests for batch, default to standard input")
        ("run-dir", po::value<string>(), "set the directory to run user programs. You can either pass it from environ RUNDIR")
        ("workers", po::value<size_t>(), "set the number of concurrent executions. You can either pass it from environ WORKERS")
        ("queue-capacity", po::value<size_t>(), "set the number of submissions allowed to wait for a worker")
        ("output-limit", po::value<size_t>(), "set the maximum size of stdout and stderr in KB")
        ("allow-network-fallback", "run programs even if the network namespace cannot be created")
        ("debug", "turn on the debug mode to keep the scratch directories of executions. You can either pass it from environ DEBUG")
        ("help", "display this help text");
    // clang-format on
    positional.add("command", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help") || !vm.count("command")) {
        cout << "grader: run untrusted code and grade it against problem tests" << endl
             << "Usage: " << argv[0] << " <run|judge|signature|validate|batch> [options]" << endl;
        cout << desc << endl;
        return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    try {
        grader::engine_config config = load_engine_config(vm);
        CHECK(config.workers > 0) << "At least one worker is required";

        grader::translate::language_registry languages;
        languages.configure(config.languages);

        error_code ec;
        filesystem::create_directories(config.run_dir, ec);
        CHECK(filesystem::is_directory(config.run_dir))
            << "Run directory " << config.run_dir << " does not exist";

        auto runner = make_unique<grader::sandbox::process_executor>(grader::make_execution_context(config));
        grader::engine engine(config, move(languages), move(runner));

        string command = vm.at("command").as<string>();
        if (command == "run") return command_run(engine, vm);
        if (command == "judge") return command_judge(engine, vm);
        if (command == "signature") return command_signature(engine, vm);
        if (command == "validate") return command_validate(engine, vm);
        if (command == "batch") return command_batch(engine, vm);

        cerr << "Unknown command " << command << endl
             << desc << endl;
        return EXIT_FAILURE;
    } catch (grader::invalid_request &ex) {
        cerr << ex.what() << endl;
        return EXIT_FAILURE;
    } catch (grader::translation_error &ex) {
        cerr << ex.reason() << ": " << ex.what() << endl;
        return EXIT_FAILURE;
    } catch (grader::internal_error &ex) {
        LOG(ERROR) << "Grader has crashed, " << ex;
        return EXIT_FAILURE;
    } catch (std::exception &ex) {
        LOG(ERROR) << "Grader has crashed, " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        return EXIT_FAILURE;
    }
}
