#include "testrunner/workdir.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "testrunner/common/exceptions.hpp"

namespace testrunner {
using namespace std;
namespace fs = std::filesystem;

void change_working_directory(const fs::path &dir) {
    error_code ec;
    fs::file_status status = fs::status(dir, ec);
    if (ec || !fs::exists(status))
        throw configuration_error(fmt::format("no such directory: {}", dir.string()));
    if (!fs::is_directory(status))
        throw configuration_error(fmt::format("not a directory: {}", dir.string()));

    fs::current_path(dir, ec);
    if (ec)
        throw configuration_error(fmt::format("cannot change directory to {}: {}", dir.string(), ec.message()));

    LOG(INFO) << "changed working directory to " << fs::current_path(ec).string();
}

}  // namespace testrunner
