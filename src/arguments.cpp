#include "testrunner/arguments.hpp"
#include <math.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <climits>
#include "testrunner/common/exceptions.hpp"
#include "testrunner/config.hpp"

namespace testrunner {
using namespace std;
namespace po = boost::program_options;

void validate(boost::any &v, const vector<string> &values, timeout_limit *, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);

    timeout_limit result;
    string const &s = validators::get_single_string(values);
    try {
        result.seconds = boost::lexical_cast<double>(s);
    } catch (boost::bad_lexical_cast &) {
        throw validation_error(validation_error::invalid_option_value);
    }

    if (!isfinite(result.seconds) || result.seconds <= 0 || result.seconds > MAX_TIMEOUT)
        throw validation_error(validation_error::invalid_option_value);

    v = result;
}

/**
 * Stops option processing for good: a bare "--" or the first token that
 * is not an option starts the command, and every remaining token is handed
 * over as a positional value without being looked at.
 */
static vector<po::option> split_command(vector<string> &args) {
    vector<po::option> result;
    const string &tok = args[0];

    // A single token is left to the stock parsers: a trailing "--" or a
    // one-word command end up positional there as well, and finish_option()
    // probes option values with exactly one token.
    if (args.size() < 2) return result;

    size_t first;
    if (tok == "--") {
        first = 1;
    } else if (tok.empty() || tok[0] != '-' || tok == "-") {
        first = 0;
    } else {
        return result;
    }

    for (size_t i = first; i < args.size(); ++i) {
        po::option opt;
        opt.value.push_back(args[i]);
        opt.original_tokens.push_back(args[i]);
        opt.position_key = INT_MAX;
        result.push_back(opt);
    }
    args.clear();
    return result;
}

static po::options_description visible_options() {
    po::options_description desc("testrunner options");
    // clang-format off
    desc.add_options()
        ("verbose", "log a begin marker before and an end marker after running the command")
        ("label", po::value<string>(), "name of the test shown in the begin/end markers (defaults to the command's file name)")
        ("timeout", po::value<timeout_limit>(), "kill the command after this many seconds (floating point is acceptable)")
        ("chdir,C", po::value<string>(), "change to this directory before running the command")
        ("help", "display this help text");
    // clang-format on
    return desc;
}

void print_usage_line(ostream &os) {
    os << "Usage: " << LOG_PREFIX << " [options] [--] <command> [args...]" << endl;
}

void print_usage(ostream &os) {
    os << "Testrunner: run a test command with a timeout and report how it terminated." << endl;
    print_usage_line(os);
    os << visible_options() << endl;
}

invocation parse_arguments(const vector<string> &args) {
    po::options_description desc = visible_options();
    po::options_description hidden;
    hidden.add_options()("command", po::value<vector<string>>(), "command and its arguments");
    desc.add(hidden);

    po::positional_options_description pos;
    pos.add("command", -1);

    po::variables_map vm;
    invocation inv;

    try {
        po::store(po::command_line_parser(args)
                      .options(desc)
                      .positional(pos)
                      .extra_style_parser(split_command)
                      .style(po::command_line_style::default_style & ~po::command_line_style::allow_guessing)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        throw argument_error(e.what());
    }

    if (vm.count("help")) {
        inv.help = true;
        return inv;
    }

    if (vm.count("verbose")) inv.verbose = true;
    if (vm.count("label")) inv.label = vm["label"].as<string>();
    if (vm.count("timeout")) inv.use_timeout = true, inv.timeout = vm["timeout"].as<timeout_limit>();
    if (vm.count("chdir")) {
        inv.chdir = vm["chdir"].as<string>();
        if (inv.chdir.empty()) throw argument_error("the argument for option '--chdir' is empty");
    }
    if (vm.count("command")) inv.command = vm["command"].as<vector<string>>();

    if (inv.command.empty()) throw argument_error("not enough arguments");

    return inv;
}

invocation parse_arguments(int argc, const char *argv[]) {
    vector<string> args;
    for (int i = 1; i < argc; ++i) args.push_back(argv[i]);
    return parse_arguments(args);
}

}  // namespace testrunner
