#include "language.hpp"
#include <map>
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"
#include "common/utils.hpp"

namespace execjudge {
using namespace std;

bool language_profile::needs_compile() const {
    return !compile_command.empty();
}

static map<language, language_profile> make_profiles() {
    map<language, language_profile> profiles;

    {
        language_profile p;
        p.id = language::PYTHON;
        p.name = "python";
        p.source_file = "main.py";
        p.run_command = {"python3", "-B", "{source}"};
        p.memory_factor = 1.5;
        p.oom_markers = {"MemoryError"};
        profiles[p.id] = p;
    }

    {
        language_profile p;
        p.id = language::JAVASCRIPT;
        p.name = "javascript";
        p.source_file = "main.js";
        p.run_command = {"node", "--max-old-space-size={memory}", "{source}"};
        p.memory_factor = 2;
        p.oom_markers = {"JavaScript heap out of memory", "Allocation failed"};
        p.managed_heap = true;
        profiles[p.id] = p;
    }

    {
        language_profile p;
        p.id = language::JAVA;
        p.name = "java";
        p.source_file = "Main.java";
        p.executable = "Main";
        p.compile_command = {"javac", "-J-Xmx256m", "-encoding", "UTF-8", "-d", ".", "{source}"};
        p.run_command = {"java", "-Xmx{memory}m", "-Xss64m", "-XX:+UseSerialGC", "-cp", ".", "{executable}"};
        p.time_factor = 1.5;
        p.memory_factor = 2;
        p.oom_markers = {"java.lang.OutOfMemoryError"};
        p.managed_heap = true;
        profiles[p.id] = p;
    }

    {
        language_profile p;
        p.id = language::CPP;
        p.name = "cpp";
        p.source_file = "main.cpp";
        p.executable = "main";
        p.compile_command = {"g++", "-O2", "-std=c++17", "-pipe", "-o", "{executable}", "{source}"};
        p.run_command = {"./{executable}"};
        p.oom_markers = {"std::bad_alloc"};
        profiles[p.id] = p;
    }

    return profiles;
}

static const map<language, language_profile> &profiles() {
    static const map<language, language_profile> instance = make_profiles();
    return instance;
}

language parse_language(const string &name) {
    string key = to_lower(name);
    for (auto &[id, profile] : profiles())
        if (profile.name == key) return id;
    throw unsupported_language(name);
}

const char *language_name(language lang) {
    return resolve(lang).name.c_str();
}

const language_profile &resolve(language lang) {
    auto it = profiles().find(lang);
    if (it == profiles().end())
        throw unsupported_language(to_string((int)lang));
    return it->second;
}

const language_profile &resolve(const string &name) {
    return resolve(parse_language(name));
}

vector<string> expand_command(const language_profile &profile, const vector<string> &command, int memory_mb) {
    vector<string> result;
    for (string arg : command) {
        arg = replace_all(arg, "{source}", profile.source_file);
        arg = replace_all(arg, "{executable}", profile.executable);
        arg = replace_all(arg, "{memory}", to_string(memory_mb));
        result.push_back(arg);
    }
    return result;
}

}  // namespace execjudge
