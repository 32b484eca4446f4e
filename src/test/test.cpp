#include <sstream>
#include <algorithm>
#include <vector>

#include "test.hpp"
#include "util/string.hpp"

extern "C" {
#include <unistd.h>
#include <sys/types.h>
#include <sys/stat.h>
}

using std::string;
using std::vector;

namespace test {

std::basic_ostream<char> &Say(std::basic_ostream<char> &stream) {
    return stream << "- ";
}

void ExpectReturn(int ret, int exp, int line, const char *func) {
    if (ret == exp)
        return;
    throw string("Got " + std::to_string(ret) + ", but expected " + std::to_string(exp) + " at " + func + ":" + std::to_string(line));
}

void ExpectError(const TError &ret, EError exp, int line, const char *func) {
    std::stringstream ss;

    if (ret == exp)
        return;

    ss << "Got " << ret << ", but expected " << TError::ErrorName(exp) << " at " << func << ":" << line;

    throw ss.str();
}

TPath MakeTempDir(const std::string &prefix) {
    TPath path;
    TError error = path.MkdirTmp("/tmp", prefix, 0755);
    if (error)
        throw string("Cannot create temporary directory: " + error.ToString());
    return path;
}

void RemoveTempDir(const TPath &path) {
    TError error = path.RemoveAll();
    if (error)
        Say(std::cerr) << "Cannot remove " << path << ": " << error << std::endl;
}

string ReadFile(const TPath &path) {
    string text;
    TError error = path.ReadAll(text);
    if (error)
        throw string("Cannot read " + path.ToString() + ": " + error.ToString());
    return text;
}

void WriteFile(const TPath &path, const string &text) {
    TError error = path.WriteAll(text);
    if (error)
        throw string("Cannot write " + path.ToString() + ": " + error.ToString());
}

string DumpTree(const TPath &root) {
    vector<string> lines;
    TPathWalk walk;
    TError error;

    error = walk.OpenList(root);
    if (error)
        throw string("Cannot walk " + root.ToString() + ": " + error.ToString());

    while (true) {
        error = walk.Next();
        if (error)
            throw string("Cannot walk " + root.ToString() + ": " + error.ToString());
        if (!walk.Path)
            break;
        if (walk.Postorder || walk.Level() == 0)
            continue;

        const struct stat &st = *walk.Stat;
        string line = root.InnerPath(walk.Path, false).ToString();

        line += fmt::format(" {:o} {}:{} {}", st.st_mode, st.st_uid, st.st_gid,
                            (long)st.st_mtim.tv_sec);

        if (S_ISREG(st.st_mode)) {
            line += " " + std::to_string(st.st_size) + " " + ReadFile(walk.Path);
        } else if (S_ISLNK(st.st_mode)) {
            TPath target;
            error = walk.Path.ReadLink(target);
            if (error)
                throw string("Cannot read link " + walk.Path.ToString());
            line += " -> " + target.ToString();
        }

        lines.push_back(line);
    }

    std::sort(lines.begin(), lines.end());

    string result;
    for (auto &line: lines)
        result += line + "\n";
    return result;
}

template<typename T>
static inline void ExpectEqTemplate(T ret, T exp, size_t line, const char *func) {
    if (ret != exp) {
        std::stringstream ss;
        ss << "Unexpected " << ret << " != " << exp << " at " << func << ":" << line;
        throw ss.str();
    }
}

template<typename T>
static inline void ExpectNeqTemplate(T ret, T exp, size_t line, const char *func) {
    if (ret == exp) {
        std::stringstream ss;
        ss << "Unexpected " << ret << " == " << exp << " at " << func << ":" << line;
        throw ss.str();
    }
}

void _ExpectEq(size_t ret, size_t exp, size_t line, const char *func) {
    ExpectEqTemplate(ret, exp, line, func);
}

void _ExpectEq(const std::string &ret, const std::string &exp, size_t line, const char *func) {
    ExpectEqTemplate(ret, exp, line, func);
}

void _ExpectNeq(size_t ret, size_t exp, size_t line, const char *func) {
    ExpectNeqTemplate(ret, exp, line, func);
}

void _ExpectNeq(const std::string &ret, const std::string &exp, size_t line, const char *func) {
    ExpectNeqTemplate(ret, exp, line, func);
}
}
