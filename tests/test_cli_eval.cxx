// Spawns the interpreter directly instead of going through a shell, capturing stdout and
// stderr through one pipe, or stderr into 'errPath' when given. Standard input is /dev/null.

#include <array>
#include <cassert>
#include <cstdio>
#include <fcntl.h>
#include <fstream>
#include <string>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

struct CliResult {
    int exitCode = -1;
    std::string out;
};

static std::string readFile(const char* fname) {
    std::ifstream f(fname, std::ios::binary);
    std::string text;
    char c;
    while (f.get(c)) text.push_back(c);
    return text;
}

static CliResult run_cli(const std::vector<std::string>& extra, const char* errPath = nullptr) {
    std::vector<std::string> args{BFT_EXE_PATH};
    args.insert(args.end(), extra.begin(), extra.end());
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& s : args) argv.push_back(s.data());
    argv.push_back(nullptr);

    int pipefd[2];
    assert(pipe(pipefd) == 0);
    pid_t pid = fork();
    assert(pid >= 0);
    if (pid == 0) {
        close(pipefd[0]);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(pipefd[1], STDOUT_FILENO);
        if (errPath) {
            int errfd = open(errPath, O_WRONLY | O_CREAT | O_TRUNC, 0644);
            if (errfd >= 0) dup2(errfd, STDERR_FILENO);
        } else {
            dup2(pipefd[1], STDERR_FILENO);
        }
        execv(argv[0], argv.data());
        _exit(127);
    }
    close(pipefd[1]);
    std::array<char, 256> buf{};
    CliResult result;
    ssize_t n;
    while ((n = read(pipefd[0], buf.data(), buf.size())) > 0) {
        result.out.append(buf.data(), static_cast<size_t>(n));
    }
    close(pipefd[0]);
    int status;
    waitpid(pid, &status, 0);
    assert(WIFEXITED(status));
    result.exitCode = WEXITSTATUS(status);
    return result;
}

static void writeFile(const char* fname, const std::string& text) {
    std::ofstream f(fname, std::ios::binary);
    f << text;
}

static bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

static void test_run_file() {
    const char* fname = "cli_hello.bf";
    writeFile(fname, "++++++++[>++++++++<-]>+.  prints A");
    CliResult r = run_cli({fname});
    assert(r.exitCode == 0);
    assert(r.out == "A\n");
    std::remove(fname);
}

static void test_tape_bounds() {
    const char* fname = "cli_right.bf";
    writeFile(fname, ">>+");
    CliResult fixed = run_cli({"-c", "2", fname});
    assert(fixed.exitCode == 1);
    assert(contains(fixed.out, "cli_right.bf:1:2: Head fell off the tape"));
    assert(contains(fixed.out, "beyond end"));
    CliResult grown = run_cli({"--cells", "2", "-e", fname});
    assert(grown.exitCode == 0);
    assert(grown.out == "\n");
    std::remove(fname);
}

static void test_unmatched() {
    const char* fname = "cli_open.bf";
    writeFile(fname, "+.\n[");
    CliResult r = run_cli({fname});
    assert(r.exitCode == 1);
    assert(contains(r.out, "cli_open.bf:2:1: Unmatched open bracket"));
    // Validation happens before anything runs
    assert(!contains(r.out, "\x01"));
    std::remove(fname);
}

static void test_eof() {
    const char* fname = "cli_read.bf";
    writeFile(fname, ",");
    CliResult r = run_cli({fname});
    assert(r.exitCode == 1);
    assert(contains(r.out, "unexpected end of input"));
    std::remove(fname);
}

static void test_usage_errors() {
    CliResult zero = run_cli({"-c", "0", "x.bf"});
    assert(zero.exitCode == 1);
    assert(contains(zero.out, "positive integer"));
    CliResult missingValue = run_cli({"-c"});
    assert(missingValue.exitCode == 1);
    CliResult noProgram = run_cli({});
    assert(noProgram.exitCode == 1);
    assert(contains(noProgram.out, "Missing PROGRAM"));
    CliResult unknown = run_cli({"--bogus"});
    assert(unknown.exitCode == 1);
    assert(contains(unknown.out, "Unknown option"));
    CliResult missingFile = run_cli({"cli_no_such_file.bf"});
    assert(missingFile.exitCode == 1);
    assert(contains(missingFile.out, "could not be opened"));
    const char* dname = "cli_dir.bf";
    rmdir(dname);
    assert(mkdir(dname, 0755) == 0);
    CliResult directory = run_cli({dname});
    rmdir(dname);
    assert(directory.exitCode == 1);
    assert(contains(directory.out, "ERROR:"));
    assert(contains(directory.out, dname));
}

static void test_info_flags() {
    CliResult version = run_cli({"-V"});
    assert(version.exitCode == 0);
    assert(contains(version.out, "bft 1.0.0"));
    CliResult help = run_cli({"--help"});
    assert(help.exitCode == 0);
    assert(contains(help.out, "Usage:"));

    const char* fname = "cli_list.bf";
    writeFile(fname, "+\n >");
    CliResult listing = run_cli({"-p", fname});
    assert(listing.exitCode == 0);
    assert(listing.out ==
           "cli_list.bf: 1:1 Increment current data\n"
           "cli_list.bf: 2:2 Increment current pointer\n");
    std::remove(fname);
}

static void test_diagnostic_flags() {
    const char* fname = "cli_diag.bf";
    const char* errName = "cli_diag.err";
    writeFile(fname, "+++.,");
    CliResult r = run_cli({"-t", "-i", "-dm", "--profile", fname}, errName);
    const std::string err = readFile(errName);
    std::remove(fname);
    std::remove(errName);
    // ',' hits end of input, the dump and profile are still printed
    assert(r.exitCode == 1);
    assert(r.out ==
           "\x03\n"
           "Memory dump:\n"
           "row+col |0  |1  |2  |3  |4  |5  |6  |7  |8  |9  |\n"
           "0       |[3]|\n");
    assert(contains(err, "trace:"));
    assert(contains(err, "1:4 Print out current data"));
    assert(contains(err, "Input a value: "));
    assert(contains(err, "Instructions executed: 4"));
    assert(contains(err, "Elapsed time: "));
    assert(contains(err, "cli_diag.bf:1:5: I/O error (Type into current data)"));
}

int main() {
    test_run_file();
    test_tape_bounds();
    test_unmatched();
    test_eof();
    test_usage_errors();
    test_info_flags();
    test_diagnostic_flags();
    return 0;
}
