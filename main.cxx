/*
    bft - A brainfuck tape interpreter
    Main standalone file
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

#include "report.hxx"
#include "vm.hxx"
#ifdef BFT_ENABLE_TERM
#include "cpp-terminal/color.hpp"
#endif

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace {
struct CmdArgs {
    std::string filename;
    std::size_t tapeSize = BFT_DEFAULT_TAPE_SIZE;
    bool extensible = BFT_DEFAULT_EXTENSIBLE;
    bool printProgram = false;
    bool trace = false;
    bool prompt = false;
    bool dumpMemory = false;
    bool profile = false;
    bool help = false;
    bool version = false;
    std::string usageError;
};

void printError(std::string_view msg) {
#ifdef BFT_ENABLE_TERM
    std::cerr << Term::color_fg(Term::Color::Name::Red)
              << "ERROR:" << Term::color_fg(Term::Color::Name::Default) << ' ' << msg
              << std::endl;
#else
    std::cerr << "ERROR: " << msg << std::endl;
#endif
}

void printWarning(std::string_view msg) {
#ifdef BFT_ENABLE_TERM
    std::cerr << Term::color_fg(Term::Color::Name::Yellow)
              << "WARNING:" << Term::color_fg(Term::Color::Name::Default) << ' ' << msg
              << std::endl;
#else
    std::cerr << "WARNING: " << msg << std::endl;
#endif
}

bool stdoutIsTerminal() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

CmdArgs parseArgs(int argc, char* argv[]) {
    CmdArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-c" || arg == "--cells") {
            if (i + 1 >= argc) {
                args.usageError = "Missing value for " + std::string(arg);
                break;
            }
            const char* val = argv[++i];
            char* end = nullptr;
            unsigned long long parsed = std::strtoull(val, &end, 10);
            if (val[0] == '-' || end == val || *end != '\0' || parsed == 0) {
                args.usageError = "Cell count must be a positive integer: " + std::string(val);
                break;
            }
            args.tapeSize = static_cast<std::size_t>(parsed);
        } else if (arg == "-e" || arg == "--extensible") {
            args.extensible = true;
        } else if (arg == "-p" || arg == "--print") {
            args.printProgram = true;
        } else if (arg == "-t" || arg == "--trace") {
            args.trace = true;
        } else if (arg == "-i" || arg == "--prompt") {
            args.prompt = true;
        } else if (arg == "-dm" || arg == "--dump-memory") {
            args.dumpMemory = true;
        } else if (arg == "--profile") {
            args.profile = true;
        } else if (arg == "-h" || arg == "--help") {
            args.help = true;
        } else if (arg == "-V" || arg == "--version") {
            args.version = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            args.usageError = "Unknown option: " + std::string(arg);
            break;
        } else if (args.filename.empty()) {
            args.filename = std::string(arg);
        } else {
            args.usageError = "Unexpected argument: " + std::string(arg);
            break;
        }
    }
    return args;
}

void printHelp(const char* prog, std::ostream& out) {
    out << "Usage: " << prog << " [options] PROGRAM\n"
        << "Options:\n"
        << "  -c, --cells <n>      Cells to allocate for the tape, must be > 0 (default "
        << BFT_DEFAULT_TAPE_SIZE << ")\n"
        << "  -e, --extensible     Let the tape grow past its initial size\n"
        << "  -p, --print          List the parsed instructions and exit\n"
        << "  -t, --trace          Log each executed instruction to stderr\n"
        << "  -i, --prompt         Prompt on stderr before each input read\n"
        << "  -dm, --dump-memory   Dump memory after program\n"
        << "  --profile            Print execution profile\n"
        << "  -V, --version        Show version\n"
        << "  -h, --help           Show this help message" << std::endl;
}
}  // namespace

int main(int argc, char* argv[]) {
    const CmdArgs opts = parseArgs(argc, argv);
    if (!opts.usageError.empty()) {
        printError(opts.usageError);
        printHelp(argv[0], std::cerr);
        return 1;
    }
    if (opts.help) {
        printHelp(argv[0], std::cout);
        return 0;
    }
    if (opts.version) {
        std::cout << "bft " << BFT_VERSION << std::endl;
        return 0;
    }
    if (opts.filename.empty()) {
        printError("Missing PROGRAM argument");
        printHelp(argv[0], std::cerr);
        return 1;
    }
    const std::size_t widthBytes = sizeof(std::uint8_t);
    if (opts.tapeSize > (BFT_TAPE_MAX_BYTES / widthBytes)) {
        printError("Requested tape exceeds maximum allowed size (" +
                   std::to_string(BFT_TAPE_MAX_BYTES >> 20) + " MiB)");
        return 1;
    }
    std::size_t requiredMem = opts.tapeSize * widthBytes;
    if (requiredMem > BFT_TAPE_WARN_BYTES) {
        printWarning("Tape allocation ~" + std::to_string(requiredMem >> 20) +
                     " MiB may exceed system memory");
    }

    bft::Program program;
    bft::Status status = bft::Program::fromFile(opts.filename, program);
    if (!status.ok()) {
        printError(status.describe(""));
        return 1;
    }
    status = program.validate();
    if (!status.ok()) {
        printError(status.describe(program.name()));
        return 1;
    }
    if (opts.printProgram) {
        program.listing(std::cout);
        return 0;
    }

    bft::ProfileInfo prof;
    bft::VmOptions vmOpts;
    vmOpts.trace = opts.trace;
    vmOpts.prompt = opts.prompt;
    vmOpts.profile = opts.profile ? &prof : nullptr;
    bft::VirtualMachine<std::uint8_t> vm(opts.tapeSize, opts.extensible, program, vmOpts);
    status = vm.interpret(std::cin, std::cout);
    if (opts.dumpMemory) {
        bft::dumpMemory<std::uint8_t>(vm.tape(), vm.head(), std::cout, stdoutIsTerminal());
    }
    if (opts.profile) {
        std::cerr << "Instructions executed: " << prof.instructions << std::endl;
        std::cerr << "Elapsed time: " << prof.seconds << "s" << std::endl;
    }
    if (!status.ok()) {
        printError(status.describe(program.name()));
        return 1;
    }
    return 0;
}
