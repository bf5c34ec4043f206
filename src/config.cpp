#include "testrunner/config.hpp"
#include <glog/logging.h>
#include "testrunner/common/utils.hpp"

namespace testrunner {
using namespace std;

const double TIMEOUT_WARNING_MARGIN = 0.2;
const double MAX_TIMEOUT = 1e9;
const char *LOG_PREFIX = "testrunner";
const char *CHILD_KIND = "exec";

filesystem::path LOG_DIR;
bool DEBUG = false;

void load_environment() {
    LOG_DIR = get_env("TESTRUNNER_LOG_DIR", "");
    string debug = get_env("TESTRUNNER_DEBUG", "");
    DEBUG = !debug.empty() && debug != "0";
}

void init_logging(const char *argv0) {
    if (DEBUG) {
        FLAGS_logtostderr = true;
    } else if (!LOG_DIR.empty()) {
        FLAGS_log_dir = LOG_DIR.string();
        FLAGS_stderrthreshold = google::GLOG_FATAL;
    } else {
        // Nothing below FATAL is recorded, so no log file is ever opened.
        FLAGS_minloglevel = google::GLOG_FATAL;
        FLAGS_stderrthreshold = google::GLOG_FATAL;
    }
    google::InitGoogleLogging(argv0);
}

}  // namespace testrunner
