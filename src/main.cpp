#include <iostream>
#include <string>
#include <vector>
#include "testrunner/config.hpp"
#include "testrunner/supervisor.hpp"

using namespace std;

int main(int argc, const char *argv[]) {
    testrunner::load_environment();
    testrunner::init_logging(argv[0]);

    vector<string> args(argv + 1, argv + argc);
    return testrunner::execute(args, cout, cerr);
}
