#include <glog/logging.h>
#include <math.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include "run.hpp"
#include "utils.hpp"

using namespace std;

void validate(boost::any& v, const vector<string>& values, int64_t*, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);

    string const& s = validators::get_single_string(values);
    if (s.empty() || s[0] == '-') {
        throw validation_error(validation_error::invalid_option_value);
    }

    v = boost::lexical_cast<int64_t>(s);
}

void validate(boost::any& v, const vector<string>& values, struct time_limit*, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);

    struct time_limit result;
    string const& s = validators::get_single_string(values);
    auto colon = s.find(':');
    string left = s.substr(0, colon);
    string right = colon < s.size() ? s.substr(colon + 1) : "";

    try {
        result.soft = boost::lexical_cast<double>(left);
        if (right.size())
            result.hard = boost::lexical_cast<double>(right);
        else
            result.hard = result.soft;
    } catch (boost::bad_lexical_cast&) {
        throw validation_error(validation_error::invalid_option_value);
    }

    if (result.hard < result.soft ||
        !isfinite(result.hard) || !isfinite(result.soft) ||
        result.hard < 0 || result.soft < 0)
        throw validation_error(validation_error::invalid_option_value);

    v = result;
}

static int parse_user(const string& user) {
    if (is_number(user)) return boost::lexical_cast<int>(user);
    int uid = get_userid(user.c_str());
    if (uid < 0) throw runtime_error("invalid username or user id: " + user);
    return uid;
}

static int parse_group(const string& group) {
    if (is_number(group)) return boost::lexical_cast<int>(group);
    int gid = get_groupid(group.c_str());
    if (gid < 0) throw runtime_error("invalid groupname or group id: " + group);
    return gid;
}

static int64_t kilobytes(int64_t kb) {
    // 溢出时视为不限制
    if (kb > INT64_MAX / 1024) return -1;
    return kb * 1024;
}

int main(int argc, const char* argv[]) {
    FLAGS_logtostderr = true;
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("runguard options");
    po::positional_options_description pos;
    po::variables_map vm;

    struct runguard_options opt;

    // clang-format off
    desc.add_options()
        ("root,r", po::value<string>(), "run command with root directory set to root. If this option is provided, running command is executed relative to the chroot.")
        ("user,u", po::value<string>(), "run command as user with username or user id")
        ("group,g", po::value<string>(), "run command under group with groupname or group id. If only 'user' is set, this defaults to the primary group of the user")
        ("work-dir,d", po::value<string>(), "change to the directory before running command (relative to root)")
        ("wall-time,T", po::value<time_limit>(), "kill command after wall time clock seconds (floating point is acceptable)")
        ("cpu-time,t", po::value<time_limit>(), "set maximum CPU time (floating point is acceptable) consumption of the command in seconds")
        ("memory-limit,m", po::value<int64_t>(), "set maximum memory consumption of the command in KB")
        ("file-limit,f", po::value<int64_t>(), "set maximum created file size of the command in KB")
        ("nproc,p", po::value<int64_t>(), "set maximum process living simutanously")
        ("no-core-dumps", "disable core dumps")
        ("standard-input-file,i", po::value<string>(), "redirect command standard input fd to file")
        ("standard-output-file,o", po::value<string>(), "redirect command standard output fd to file")
        ("standard-error-file,e", po::value<string>(), "redirect command standard error fd to file")
        ("stream-size,s", po::value<int64_t>(), "truncate command output streams at the size in KB")
        ("environment,E", "preseve system environment variables (or only PATH is loaded)")
        ("variable,V", po::value<vector<string>>(), "add additional environment variables (e.g. -Vkey1=value1 -Vkey2=value2)")
        ("out-meta,M", po::value<string>(), "write runguard monitor results (run time, exitcode, memory usage, ...) to file")
        ("no-network", "forbid the command to create network sockets")
        ("require-isolation", "fail instead of running the command if namespaces or seccomp are unavailable")
        ("cmd", po::value<vector<string>>()->composing()->required(), "commands")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    pos.add("cmd", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(pos)
                      .run(),
                  vm);

        if (vm.count("help")) {
            cout << "Runguard: Running user program in protected mode with system resource access limitations." << endl
                 << "This app requires root privilege if either 'root' or 'user' option is provided." << endl
                 << "Usage: " << argv[0] << " [options] -- [command]" << endl;
            cout << desc << endl;
            return 0;
        }

        if (vm.count("version")) {
            cout << "runguard" << endl;
            return 0;
        }

        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return 1;
    }

    try {
        if (vm.count("root")) opt.chroot_dir = vm["root"].as<string>();
        if (vm.count("work-dir")) opt.work_dir = vm["work-dir"].as<string>();

        if (vm.count("user")) opt.user_id = parse_user(vm["user"].as<string>());

        if (vm.count("group")) {
            opt.group_id = parse_group(vm["group"].as<string>());
        } else if (opt.user_id >= 0) {
            opt.group_id = get_user_groupid(opt.user_id);
            if (opt.group_id < 0) opt.group_id = opt.user_id;
        }
    } catch (exception& e) {
        cerr << e.what() << endl;
        return 1;
    }

    if (vm.count("variable")) opt.env = vm["variable"].as<vector<string>>();

    if (vm.count("wall-time")) opt.use_wall_limit = true, opt.wall_limit = vm["wall-time"].as<time_limit>();
    if (vm.count("cpu-time")) opt.use_cpu_limit = true, opt.cpu_limit = vm["cpu-time"].as<time_limit>();
    if (vm.count("memory-limit")) opt.memory_limit = kilobytes(vm["memory-limit"].as<int64_t>());
    if (vm.count("file-limit")) opt.file_limit = kilobytes(vm["file-limit"].as<int64_t>());
    if (vm.count("nproc")) opt.nproc = (size_t)vm["nproc"].as<int64_t>();
    if (vm.count("no-core-dumps")) opt.no_core_dumps = true;
    if (vm.count("standard-input-file")) opt.stdin_filename = vm["standard-input-file"].as<string>();
    if (vm.count("standard-output-file")) opt.stdout_filename = vm["standard-output-file"].as<string>();
    if (vm.count("standard-error-file")) opt.stderr_filename = vm["standard-error-file"].as<string>();
    if (vm.count("stream-size")) opt.stream_size = kilobytes(vm["stream-size"].as<int64_t>());
    if (vm.count("environment")) opt.preserve_sys_env = true;
    if (vm.count("out-meta")) opt.metafile_path = vm["out-meta"].as<string>();
    if (vm.count("no-network")) opt.no_network = true;
    if (vm.count("require-isolation")) opt.require_isolation = true;
    opt.command = vm["cmd"].as<vector<string>>();

    return runit(opt);
}
