// Child program used by the tests: records the argv and working directory
// it was started with, then exits with a chosen code.
//
//   ARGV_DUMP_OUTPUT  file receiving argv[1..], each argument NUL-terminated
//   ARGV_DUMP_CWD     file receiving the working directory
//   ARGV_DUMP_EXIT    exit code (default 0)
#include <stdlib.h>
#include <filesystem>
#include <fstream>
#include <string>

using namespace std;

int main(int argc, char *argv[]) {
    if (const char *path = getenv("ARGV_DUMP_OUTPUT")) {
        ofstream fout(path, ios::binary);
        for (int i = 1; i < argc; ++i) {
            fout << argv[i];
            fout.put('\0');
        }
    }

    if (const char *path = getenv("ARGV_DUMP_CWD")) {
        ofstream fout(path, ios::binary);
        fout << filesystem::current_path().string();
    }

    const char *code = getenv("ARGV_DUMP_EXIT");
    return code ? atoi(code) : 0;
}
