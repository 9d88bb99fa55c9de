#include <curl/curl.h>
#include <glog/logging.h>
#include <sys/stat.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/evaluator.hpp"
#include "sandbox/container.hpp"
#include "sandbox/process.hpp"
#include "worker.hpp"
using namespace std;

struct backend_option {
    string name;
};

void validate(boost::any& v, const vector<string>& values, backend_option*, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);
    string const& s = validators::get_single_string(values);
    if (s != "container" && s != "process")
        throw validation_error(validation_error::invalid_option_value);
    v = backend_option{s};
}

struct format_option {
    string name;
};

void validate(boost::any& v, const vector<string>& values, format_option*, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);
    string const& s = validators::get_single_string(values);
    if (s != "json" && s != "text")
        throw validation_error(validation_error::invalid_option_value);
    v = format_option{s};
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    filesystem::path current(argv[0]);
    filesystem::path repo_dir(filesystem::weakly_canonical(current).parent_path().parent_path());

    namespace po = boost::program_options;
    po::options_description desc("quizjudge options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("request", po::value<string>()->default_value("-"), "read evaluation requests from this JSON file, or from stdin if it is -. The file contains a request object or an array of request objects.")
        ("backend", po::value<backend_option>(), "set the sandbox backend, container or process. You can either pass it from environ SANDBOX_BACKEND")
        ("format", po::value<format_option>(), "set the output format, json or text. Defaults to json")
        ("jobs,j", po::value<size_t>()->default_value(1), "evaluate this many requests concurrently")
        ("scratch-dir", po::value<string>(), "set the directory to create workspaces in. You can either pass it from environ SCRATCHDIR")
        ("script-dir", po::value<string>(), "set the directory with harness templates stored. You can either pass it from environ SCRIPTDIR")
        ("docker-socket", po::value<string>(), "set the unix socket of the container engine. You can either pass it from environ DOCKER_HOST_SOCKET")
        ("docker-api-version", po::value<string>(), "set the container engine API version, default to v1.41")
        ("image", po::value<string>(), "set the image to run harnesses in, default to python:3.9-slim. You can either pass it from environ SANDBOX_IMAGE")
        ("python", po::value<string>(), "set the python interpreter for process backend, default to python3 in PATH")
        ("time-limit", po::value<double>(), "set wall time limit in seconds for one execution, default to 5. You can either pass it from environ EXEC_TIME_LIMIT")
        ("mem-limit", po::value<int64_t>(), "set memory limit in MB for one execution, default to 512. You can either pass it from environ EXEC_MEM_LIMIT")
        ("allow-network", "do not disable network in sandboxes")
        ("debug", "turn on the debug mode to keep workspaces after evaluation to check the validity of generated files.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("request", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "quizjudge: Evaluate code, query and choice submissions in sandboxes" << endl
             << "Usage: " << argv[0] << " [options] [request.json]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "quizjudge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        quizjudge::DEBUG = true;
    }

    if (vm.count("scratch-dir")) {
        quizjudge::SCRATCH_DIR = filesystem::path(vm.at("scratch-dir").as<string>());
    } else if (getenv("SCRATCHDIR")) {
        quizjudge::SCRATCH_DIR = filesystem::path(getenv("SCRATCHDIR"));
    }
    CHECK(filesystem::is_directory(quizjudge::SCRATCH_DIR))
        << "Scratch directory " << quizjudge::SCRATCH_DIR << " does not exist";

    if (vm.count("script-dir")) {
        quizjudge::SCRIPT_DIR = filesystem::path(vm.at("script-dir").as<string>());
    } else if (getenv("SCRIPTDIR")) {
        quizjudge::SCRIPT_DIR = filesystem::path(getenv("SCRIPTDIR"));
    } else {
        filesystem::path scriptdir(repo_dir / "script" / "harness");
        if (filesystem::exists(scriptdir)) {
            quizjudge::SCRIPT_DIR = scriptdir;
        }
    }
    // 模板缺失时每个评测都会得到 ASSET_MISSING 的 verdict，这里只提醒
    if (!filesystem::is_directory(quizjudge::SCRIPT_DIR))
        LOG(WARNING) << "Script directory " << quizjudge::SCRIPT_DIR << " does not exist";

    quizjudge::DOCKER_SOCKET = vm.count("docker-socket")
                                   ? vm.at("docker-socket").as<string>()
                                   : quizjudge::get_env("DOCKER_HOST_SOCKET", quizjudge::DOCKER_SOCKET);

    if (vm.count("docker-api-version")) {
        quizjudge::DOCKER_API_VERSION = vm.at("docker-api-version").as<string>();
    }

    quizjudge::SANDBOX_IMAGE = vm.count("image")
                                   ? vm.at("image").as<string>()
                                   : quizjudge::get_env("SANDBOX_IMAGE", quizjudge::SANDBOX_IMAGE);

    if (vm.count("python")) {
        quizjudge::PYTHON_INTERPRETER = vm.at("python").as<string>();
    }

    double time_limit = quizjudge::CODE_LIMITS.wall_time_limit;
    int64_t mem_limit = quizjudge::CODE_LIMITS.memory_limit >> 20;
    try {
        if (vm.count("time-limit")) {
            time_limit = vm["time-limit"].as<double>();
        } else if (getenv("EXEC_TIME_LIMIT")) {
            time_limit = boost::lexical_cast<double>(getenv("EXEC_TIME_LIMIT"));
        }

        if (vm.count("mem-limit")) {
            mem_limit = vm["mem-limit"].as<int64_t>();
        } else if (getenv("EXEC_MEM_LIMIT")) {
            mem_limit = boost::lexical_cast<int64_t>(getenv("EXEC_MEM_LIMIT"));
        }
    } catch (boost::bad_lexical_cast& e) {
        cerr << "Invalid EXEC_TIME_LIMIT or EXEC_MEM_LIMIT: " << e.what() << endl;
        return EXIT_FAILURE;
    }
    CHECK(time_limit > 0) << "Time limit should be positive";
    CHECK(mem_limit > 0) << "Memory limit should be positive";

    for (auto* limits : {&quizjudge::CODE_LIMITS, &quizjudge::QUERY_LIMITS}) {
        limits->wall_time_limit = time_limit;
        limits->memory_limit = mem_limit << 20;
        limits->network_disabled = !vm.count("allow-network");
    }

    string backend = vm.count("backend") ? vm["backend"].as<backend_option>().name
                                         : quizjudge::get_env("SANDBOX_BACKEND", "container");
    CHECK(backend == "container" || backend == "process")
        << "Unrecognized sandbox backend " << backend;

    string format = vm.count("format") ? vm["format"].as<format_option>().name : "json";

    // 让评测系统写入的文件只允许当前用户写入
    umask(0022);

    nlohmann::json input;
    try {
        string request = vm["request"].as<string>();
        if (request == "-")
            input = nlohmann::json::parse(cin);
        else
            input = nlohmann::json::parse(quizjudge::read_file_content(request));
    } catch (std::exception& e) {
        cerr << "Unable to read evaluation requests: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    CHECK(curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK) << "Unable to initialize curl";
    defer { curl_global_cleanup(); };

    quizjudge::workspace_manager workspaces(quizjudge::SCRATCH_DIR, quizjudge::DEBUG);
    quizjudge::harness_generator generator(quizjudge::SCRIPT_DIR);

    unique_ptr<quizjudge::container_engine> engine;
    unique_ptr<quizjudge::sandbox_runner> runner;
    if (backend == "container") {
        engine = make_unique<quizjudge::container_engine>(quizjudge::DOCKER_SOCKET, quizjudge::DOCKER_API_VERSION);
        // 容器引擎不可用时每个评测都会得到 SANDBOX_UNAVAILABLE 的 verdict
        try {
            engine->ping();
            if (!engine->has_image(quizjudge::SANDBOX_IMAGE))
                LOG(WARNING) << "Image " << quizjudge::SANDBOX_IMAGE << " is not available in the container engine";
        } catch (quizjudge::judge_exception& e) {
            LOG(WARNING) << e.what();
        }
        runner = make_unique<quizjudge::container_runner>(*engine, quizjudge::SANDBOX_IMAGE, quizjudge::SANDBOX_MOUNT_DIR);
    } else {
        LOG(WARNING) << "Running submissions in process sandbox, isolation is weaker than the container sandbox";
        runner = make_unique<quizjudge::process_runner>(quizjudge::PYTHON_INTERPRETER);
    }

    quizjudge::evaluator eval(workspaces, *runner, generator);
    auto requests = quizjudge::parse_requests(input);
    size_t jobs = vm["jobs"].as<size_t>();
    if (jobs == 0) jobs = max(1u, thread::hardware_concurrency());
    auto verdicts = quizjudge::evaluate_batch(eval, requests, jobs);

    if (format == "text") {
        for (size_t i = 0; i < verdicts.size(); ++i) {
            if (i > 0) cout << endl;
            cout << quizjudge::render_report(verdicts[i]);
        }
    } else {
        nlohmann::json output = input.is_array() ? nlohmann::json(verdicts) : nlohmann::json(verdicts.front());
        cout << output.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << endl;
    }

    return EXIT_SUCCESS;
}
