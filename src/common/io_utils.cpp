#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>
#include "common/exceptions.hpp"

namespace execjudge {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(filesystem::path const &path, const string &def) {
    if (!filesystem::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout) throw system_error(errno, system_category(), "unable to open " + path.string());
    fout << content;
    if (!fout) throw system_error(errno, system_category(), "unable to write " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find("..") != string::npos || subpath.front() == '/')
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

scratch_directory::scratch_directory(const fs::path &root, bool keep) : keep(keep) {
    error_code ec;
    fs::create_directories(root, ec);
    if (ec) throw internal_execution_failure("unable to create scratch root " + root.string() + ": " + ec.message());

    string pattern = (root / "box-XXXXXX").string();
    if (!mkdtemp(pattern.data()))
        throw internal_execution_failure("unable to create scratch directory in " + root.string() + ": " + strerror(errno));
    dir = pattern;

    // 选手程序可能以另一个用户运行，需要能进入 box 目录，但不能列出 scratch 目录
    if (chmod(dir.c_str(), 0711) != 0 ||
        !fs::create_directory(dir / "box", ec) ||
        !fs::create_directory(dir / "io", ec) ||
        chmod((dir / "io").c_str(), 0700) != 0) {
        release();
        throw internal_execution_failure("unable to prepare scratch directory: " + (ec ? ec.message() : string(strerror(errno))));
    }
}

scratch_directory::scratch_directory(scratch_directory &&other)
    : dir(move(other.dir)), keep(other.keep) {
    other.dir.clear();
}

scratch_directory::~scratch_directory() {
    release();
}

const fs::path &scratch_directory::path() const {
    return dir;
}

fs::path scratch_directory::box() const {
    return dir / "box";
}

fs::path scratch_directory::io() const {
    return dir / "io";
}

/**
 * @brief 恢复目录树中所有目录的 owner 读写执行权限
 * 选手程序可以把它创建的目录设为 000，remove_all 无法进入这样的目录。不跟随符号链接。
 */
static void restore_permissions(const fs::path &path) {
    error_code ec;
    if (!fs::is_directory(fs::symlink_status(path, ec))) return;
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::add, ec);
    if (ec) return;
    for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec))
        restore_permissions(it->path());
}

void scratch_directory::release() {
    if (dir.empty()) return;
    if (keep) {
        LOG(INFO) << "Keeping scratch directory " << dir;
    } else {
        error_code ec;
        fs::remove_all(dir, ec);
        if (ec) {
            restore_permissions(dir);
            ec.clear();
            fs::remove_all(dir, ec);
        }
        if (ec) LOG(ERROR) << "Unable to remove scratch directory " << dir << ": " << ec.message();
    }
    dir.clear();
}

}  // namespace execjudge
