#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <future>
#include <iostream>
#include <nlohmann/json.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/orchestrator.hpp"
#include "sandbox/isolated_runner.hpp"
#include "server/judge_service.hpp"
#include "server/local/local_store.hpp"
#include "worker.hpp"
using namespace std;
using namespace execjudge;
using json = nlohmann::json;

/**
 * @brief 把一条批量请求转换为 JSON 结果
 * 请求格式：{"language": "python", "code": "...", "stdin": "..."}，
 * 带有 "test_cases" 时评测测试点，否则运行一次
 */
static json handle_request(server::judge_service &service, const json &request) {
    try {
        string language = nlohmann::get_value<string>(request, "language");
        string code = nlohmann::get_value<string>(request, "code");
        if (nlohmann::exists(request, "test_cases")) {
            vector<test_case> cases;
            for (auto &t : nlohmann::access(request, "test_cases")) {
                test_case tc;
                tc.input = nlohmann::get_value<string>(t, "input");
                tc.expected_output = nlohmann::get_value<string>(t, "expected_output");
                tc.hidden = nlohmann::get_value_def<bool>(t, false, "is_hidden");
                cases.push_back(tc);
            }
            return service.submit(language, code, cases);
        } else {
            return service.run_once(language, code, nlohmann::get_value_def<string>(request, "", "stdin"));
        }
    } catch (overloaded_error &ex) {
        return {{"error", "Overloaded"}, {"message", ex.what()}};
    } catch (unsupported_language &ex) {
        return {{"error", "UnsupportedLanguage"}, {"message", ex.what()}};
    } catch (invalid_argument &ex) {
        return {{"error", "InvalidRequest"}, {"message", ex.what()}};
    }
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    filesystem::path current(argv[0]);
    filesystem::path bin_dir(filesystem::weakly_canonical(current).parent_path());

    namespace po = boost::program_options;
    po::options_description desc("execjudge options");
    po::positional_options_description pos;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("mode", po::value<string>(), "run, submit or batch")
        ("config,c", po::value<string>(), "load engine configuration from JSON file")
        ("language,l", po::value<string>(), "language of the source code (python, javascript, java, cpp)")
        ("source,s", po::value<string>(), "source code file")
        ("stdin,i", po::value<string>(), "file passed to the program as standard input (run mode)")
        ("problem,p", po::value<string>(), "problem id, looked up in the problem directory")
        ("user,u", po::value<string>(), "user id of the submission (submit mode)")
        ("problem-dir", po::value<string>()->default_value("problems"), "directory with <problem id>.json files")
        ("submission-dir", po::value<string>()->default_value("submissions"), "directory to save submission records")
        ("requests", po::value<string>(), "JSON lines file of requests (batch mode)")
        ("runguard", po::value<string>(), "location of runguard. You can either pass it from environ RUNGUARD")
        ("scratch-dir", po::value<string>(), "directory to create scratch directories in. You can either pass it from environ EXECJUDGE_SCRATCH_DIR")
        ("chroot-dir", po::value<string>(), "set the chroot directory. You can either pass it from environ CHROOTDIR")
        ("run-user", po::value<string>(), "set run user. You can either pass it from environ RUNUSER")
        ("run-group", po::value<string>(), "set run group. You can either pass it from environ RUNGROUP")
        ("workers,w", po::value<size_t>(), "number of workers, default to the number of CPU cores")
        ("queue-capacity", po::value<size_t>(), "maximum number of waiting jobs, 0 for unbounded")
        ("time-limit,t", po::value<double>(), "time limit per test case in seconds")
        ("memory-limit,m", po::value<int>(), "memory limit in MB")
        ("compile-timeout", po::value<double>(), "compilation time limit in seconds")
        ("require-isolation", "fail executions when namespaces or seccomp are unavailable")
        ("debug", "keep scratch directories to check the validity of result files")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    pos.add("mode", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(pos)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help") || !vm.count("mode")) {
        cout << "execjudge: Run untrusted code in a sandbox and judge it against test cases" << endl
             << "Usage: " << argv[0] << " run|submit|batch [options]" << endl;
        cout << desc << endl;
        return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (vm.count("version")) {
        cout << "execjudge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    engine_config config = default_config();

    // 默认情况下，假设 runguard 与 execjudge 编译在同一个目录
    if (filesystem::exists(bin_dir / "runguard"))
        config.runguard = bin_dir / "runguard";

    try {
        if (vm.count("config")) load_config_file(config, vm["config"].as<string>());
        load_config_env(config);

        if (vm.count("runguard")) config.runguard = vm["runguard"].as<string>();
        if (vm.count("scratch-dir")) config.scratch_dir = vm["scratch-dir"].as<string>();
        if (vm.count("chroot-dir")) config.chroot_dir = vm["chroot-dir"].as<string>();
        if (vm.count("run-user")) config.run_user = vm["run-user"].as<string>();
        if (vm.count("run-group")) config.run_group = vm["run-group"].as<string>();
        if (vm.count("workers")) config.workers = vm["workers"].as<size_t>();
        if (vm.count("queue-capacity")) config.queue_capacity = vm["queue-capacity"].as<size_t>();
        if (vm.count("time-limit")) config.time_limit = vm["time-limit"].as<double>();
        if (vm.count("memory-limit")) config.memory_limit = vm["memory-limit"].as<int>();
        if (vm.count("compile-timeout")) config.compile_timeout = vm["compile-timeout"].as<double>();
        if (vm.count("require-isolation")) config.require_isolation = true;
        if (vm.count("debug")) config.debug = true;

        validate_config(config);
    } catch (exception& e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    string mode = vm["mode"].as<string>();
    isolated_runner runner(config);
    orchestrator judge(runner, config);
    job_queue jobs(config.workers, config.queue_capacity);
    server::local::local_problem_repository problems(vm["problem-dir"].as<string>());
    server::local::local_submission_store submissions(vm["submission-dir"].as<string>());
    server::local::memory_user_statistics stats;
    server::judge_service service(config, judge, jobs, problems, submissions, stats);
    // 任何返回路径上都先停止 worker，再析构 service 和 job_queue 引用的对象
    defer { jobs.stop(); };

    try {
        if (mode == "run") {
            if (!vm.count("language") || !vm.count("source"))
                throw invalid_argument("run mode requires --language and --source");
            string code = read_file_content(vm["source"].as<string>());
            json result;
            if (vm.count("problem")) {
                optional<string> input;
                if (vm.count("stdin")) input = read_file_content(vm["stdin"].as<string>());
                result = service.run_problem(vm["problem"].as<string>(), vm["language"].as<string>(), code, input);
            } else {
                string input = vm.count("stdin") ? read_file_content(vm["stdin"].as<string>()) : "";
                result = service.run_once(vm["language"].as<string>(), code, input);
            }
            cout << result.dump(2) << endl;
        } else if (mode == "submit") {
            if (!vm.count("language") || !vm.count("source") || !vm.count("problem") || !vm.count("user"))
                throw invalid_argument("submit mode requires --language, --source, --problem and --user");
            string code = read_file_content(vm["source"].as<string>());
            auto record = service.submit_problem(vm["user"].as<string>(), vm["problem"].as<string>(), vm["language"].as<string>(), code);
            cout << json(record).dump(2) << endl;
        } else if (mode == "batch") {
            if (!vm.count("requests"))
                throw invalid_argument("batch mode requires --requests");
            ifstream fin(vm["requests"].as<string>());
            if (!fin) throw invalid_argument("unable to open " + vm["requests"].as<string>());

            // 所有请求同时提交，超出队列容量的请求被拒绝
            vector<future<json>> results;
            string line;
            while (getline(fin, line)) {
                if (trim(line).empty()) continue;
                json request;
                try {
                    request = json::parse(line);
                } catch (json::exception& ex) {
                    results.push_back(async(launch::deferred, [message = string(ex.what())] {
                        return json{{"error", "InvalidRequest"}, {"message", message}};
                    }));
                    continue;
                }
                results.push_back(async(launch::async, [&service, request] {
                    return handle_request(service, request);
                }));
            }
            for (auto& result : results)
                cout << result.get().dump() << endl;
        } else {
            throw invalid_argument("unknown mode " + mode);
        }
    } catch (invalid_argument& ex) {
        cerr << ex.what() << endl;
        return EXIT_FAILURE;
    } catch (execjudge_exception& ex) {
        cerr << ex.what() << endl;
        LOG(ERROR) << ex;
        return EXIT_FAILURE;
    } catch (exception& ex) {
        LOG(ERROR) << boost::diagnostic_information(ex);
        cerr << ex.what() << endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
