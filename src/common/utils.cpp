#include "testrunner/common/utils.hpp"
#include <stdlib.h>
#include <boost/algorithm/string/join.hpp>

namespace testrunner {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
#ifdef _WIN32
    if (replace || !getenv(key.c_str()))
        _putenv_s(key.c_str(), value.c_str());
#else
    setenv(key.c_str(), value.c_str(), replace);
#endif
}

string join_command(const vector<string> &command) {
    return boost::algorithm::join(command, " ");
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return duration<chrono::duration<double>>().count();
}

}  // namespace testrunner
