#include "judge/engine.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <algorithm>
#include <optional>
#include <set>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "judge/classifier.hpp"
#include "translate/translator.hpp"

namespace grader {
using namespace std;

double effective_time_limit(double requested, double fallback, double ceiling) {
    double value = requested > 0 ? requested : fallback;
    return min(value, ceiling);
}

int effective_memory_limit(int requested, int fallback, int ceiling) {
    int value = requested > 0 ? requested : fallback;
    return min(value, ceiling);
}

static error_kind to_error_kind(translation_error::kind type) {
    switch (type) {
        case translation_error::kind::MALFORMED_SIGNATURE:
            return error_kind::MALFORMED_SIGNATURE;
        case translation_error::kind::SIGNATURE_NOT_FOUND:
            return error_kind::SIGNATURE_NOT_FOUND;
        case translation_error::kind::MALFORMED_TEST:
            return error_kind::MALFORMED_TEST;
    }
    return error_kind::MALFORMED_TEST;
}

engine::engine(engine_config config, translate::language_registry languages, unique_ptr<sandbox::executor> runner)
    : cfg(move(config)), registry(move(languages)), runner(move(runner)) {
    CHECK(this->runner) << "Executor must be provided";
    pool = make_unique<worker_pool>(cfg.workers, cfg.queue_capacity);
}

engine::~engine() {
    pool.reset();
}

void engine::register_listener(unique_ptr<execution_listener> &&listener) {
    listeners.push_back(move(listener));
}

pool_stats engine::stats() const {
    return pool->stats();
}

const engine_config &engine::config() const {
    return cfg;
}

const translate::language_registry &engine::languages() const {
    return registry;
}

static void call_listeners(const vector<unique_ptr<execution_listener>> &listeners, const string &execution_id,
                           const function<void(execution_listener &)> &callback) {
    for (auto &listener : listeners) {
        try {
            callback(*listener);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Listener has crashed when reporting execution " << execution_id << ", " << ex.what();
        }
    }
}

void engine::report_state(const string &execution_id, submission_state state) {
    DLOG(INFO) << "Execution " << execution_id << " " << get_state_name(state);
    call_listeners(listeners, execution_id, [&](execution_listener &l) { l.state_changed(execution_id, state); });
}

execution_result engine::finish(const submission_request &request, execution_result result) {
    call_listeners(listeners, result.execution_id, [&](execution_listener &l) { l.completed(request, result); });
    return result;
}

/**
 * @brief 一次运行的结果，在 worker 释放名额之后才交给调用方
 */
struct pending_execution {
    promise<execution_result> result;
    optional<execution_result> value;
    exception_ptr error;
};

future<execution_result> engine::admit(const string &execution_id, function<execution_result()> job) {
    auto pending = make_shared<pending_execution>();
    future<execution_result> result = pending->result.get_future();

    auto run = [this, pending, execution_id, job = move(job)] {
        try {
            pending->value = job();
        } catch (std::exception &ex) {
            LOG(ERROR) << "Execution " << execution_id << " failed unexpectedly, " << ex.what();
            report_state(execution_id, submission_state::FAILED);
            pending->error = current_exception();
        } catch (...) {
            report_state(execution_id, submission_state::FAILED);
            pending->error = current_exception();
        }
    };
    auto deliver = [pending] {
        if (pending->value) pending->result.set_value(move(*pending->value));
        else if (pending->error) pending->result.set_exception(pending->error);
        else pending->result.set_exception(make_exception_ptr(std::runtime_error("Execution produced no result")));
    };

    report_state(execution_id, submission_state::QUEUED);
    if (!pool->try_submit(move(run), move(deliver))) {
        report_state(execution_id, submission_state::REJECTED);
        LOG(WARNING) << "Execution " << execution_id << " rejected, " << pool->capacity() << " submissions in flight";
        throw system_busy("Too many submissions in flight, try again later");
    }
    return result;
}

/**
 * @brief 拒绝超出长度限制的选手代码
 */
static void check_source_size(const engine_config &cfg, const submission_request &request) {
    if (request.code.size() > cfg.source_limit_kb * 1024)
        throw invalid_request(fmt::format("Source code is {} bytes, exceeding the limit of {} KB",
                                          request.code.size(), cfg.source_limit_kb));
}

future<execution_result> engine::submit_bare(submission_request request) {
    check_source_size(cfg, request);
    const translate::language_profile &language = registry.get(request.language);
    string execution_id = random_uuid();
    return admit(execution_id, [this, execution_id, request = move(request), &language] {
        return process_bare(execution_id, request, language);
    });
}

future<execution_result> engine::submit_graded(submission_request request, shared_ptr<const problem_spec> problem) {
    if (!problem) throw invalid_request("Graded run requires a problem");
    if (problem->tests.empty()) throw invalid_request("Problem " + problem->id + " has no tests");
    check_source_size(cfg, request);
    const translate::language_profile &language = registry.get(request.language);
    bool supported = any_of(problem->supported_languages.begin(), problem->supported_languages.end(), [&](const string &name) {
        return registry.contains(name) && registry.normalize(name) == language.name;
    });
    if (!supported)
        throw invalid_request("Problem " + problem->id + " does not support language " + language.name);

    string execution_id = random_uuid();
    return admit(execution_id, [this, execution_id, request = move(request), problem, &language] {
        return process_graded(execution_id, request, *problem, language);
    });
}

execution_result engine::run_bare(const submission_request &request) {
    return submit_bare(request).get();
}

execution_result engine::run_graded(const submission_request &request, const problem_spec &problem) {
    return submit_graded(request, make_shared<const problem_spec>(problem)).get();
}

execution_result engine::process_bare(const string &execution_id, const submission_request &request,
                                      const translate::language_profile &language) {
    sandbox::execution_request exec;
    exec.source_file = language.source_file;
    exec.source = request.code;
    exec.extra_files = language.extra_files;
    exec.command = language.command;
    exec.environment = language.environment;
    exec.stdin_data = request.stdin_data;
    exec.time_limit = effective_time_limit(request.time_limit_sec, cfg.default_time_limit_sec, cfg.max_time_limit_sec);
    exec.memory_limit = effective_memory_limit(request.memory_limit_mb, cfg.default_memory_limit_mb, cfg.max_memory_limit_mb);

    return finish(request, execute_and_classify(execution_id, exec, nullptr));
}

execution_result engine::process_graded(const string &execution_id, const submission_request &request,
                                        const problem_spec &problem, const translate::language_profile &language) {
    report_state(execution_id, submission_state::TRANSLATING);

    translate::harness_source harness;
    try {
        harness = translate::translate(problem, language, request.code);
    } catch (translation_error &ex) {
        LOG(ERROR) << "Problem " << problem.id << " cannot be translated to " << language.name
                   << " for execution " << execution_id << ", " << ex.reason() << ": " << ex.what();
        execution_result result;
        result.execution_id = execution_id;
        result.stat = status::ERROR;
        result.kind = to_error_kind(ex.type());
        result.error_message = ex.what();
        result.per_test = vector<test_result>();
        report_state(execution_id, submission_state::FAILED);
        return finish(request, result);
    }

    sandbox::execution_request exec;
    exec.source_file = language.source_file;
    exec.source = harness.code;
    exec.extra_files = harness.extra_files;
    exec.command = language.command;
    exec.environment = language.environment;
    exec.stdin_data = request.stdin_data;
    exec.time_limit = effective_time_limit(request.time_limit_sec, problem.time_limit_sec,
                                           min(problem.time_limit_sec, cfg.max_time_limit_sec));
    exec.memory_limit = effective_memory_limit(request.memory_limit_mb, problem.memory_limit_mb,
                                               min(problem.memory_limit_mb, cfg.max_memory_limit_mb));
    exec.marker_delimiter = harness.delimiter;

    return finish(request, execute_and_classify(execution_id, exec, &problem.tests));
}

/**
 * @brief 根据测试结果标记生成每个测试点的结果，私有测试点不返回名字
 */
static vector<test_result> collect_per_test(const vector<sandbox::test_marker> &markers, const vector<test_case> &tests) {
    vector<test_result> per_test;
    set<size_t> seen;
    for (auto &marker : markers) {
        if (marker.index >= tests.size() || !seen.insert(marker.index).second) {
            LOG(WARNING) << "Ignoring unexpected marker for test " << marker.index;
            continue;
        }
        test_result item;
        item.index = marker.index;
        item.passed = marker.passed;
        if (tests[marker.index].vis == visibility::PUBLIC)
            item.name = tests[marker.index].name;
        per_test.push_back(item);
    }
    return per_test;
}

execution_result engine::execute_and_classify(const string &execution_id, const sandbox::execution_request &exec,
                                              const vector<test_case> *tests) {
    execution_result result;
    result.execution_id = execution_id;
    if (tests) result.per_test = vector<test_result>();

    report_state(execution_id, submission_state::EXECUTING);
    sandbox::raw_result raw;
    try {
        raw = runner->execute(exec);
    } catch (launch_error &ex) {
        LOG(ERROR) << "Unable to launch execution " << execution_id << ", " << ex.what();
        result.stat = status::ERROR;
        result.kind = error_kind::LAUNCH_ERROR;
        result.error_message = string("launch_error: ") + ex.what();
        report_state(execution_id, submission_state::FAILED);
        return result;
    }

    report_state(execution_id, submission_state::CLASSIFYING);
    classify_mode mode = tests ? classify_mode::graded_with(tests->size()) : classify_mode::bare();
    classification verdict = classify(raw, mode);

    result.stat = verdict.stat;
    result.kind = verdict.kind;
    result.error_message = verdict.error_message;
    result.stdout_text = verdict.stdout_text;
    result.stderr_text = verdict.stderr_text;
    result.exit_code = raw.exit_code;
    result.execution_time_sec = raw.wall_time;
    result.memory_peak = raw.memory_peak;
    if (tests) result.per_test = collect_per_test(raw.markers, *tests);

    LOG(INFO) << "Execution " << execution_id << " finished with status " << get_status_string(result.stat)
              << " in " << raw.wall_time << "s";
    report_state(execution_id, submission_state::COMPLETED);
    return result;
}

}  // namespace grader
