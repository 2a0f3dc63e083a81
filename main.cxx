/*
    bftool - A bounded brainfuck interpreter
    Main standalone file
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

#include "cpp-terminal/color.hpp"
#include "dump.hxx"
#include "vm.hxx"

#ifndef _WIN32
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace {
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void reportError(std::string_view msg) {
    std::cerr << Term::color_fg(Term::Color::Name::Red)
              << "ERROR:" << Term::color_fg(Term::Color::Name::Default) << ' ' << msg
              << std::endl;
}

void reportWarning(std::string_view msg) {
    std::cerr << Term::color_fg(Term::Color::Name::Yellow)
              << "WARNING:" << Term::color_fg(Term::Color::Name::Default) << ' ' << msg
              << std::endl;
}

#ifndef _WIN32
// Read-only file mapping, unmapped on destruction
struct MappedFile {
    const char* data = nullptr;
    size_t size = 0;
    int fd = -1;

    MappedFile() = default;
    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;
    ~MappedFile() { close(); }
    void close() {
        if (data && size) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
            munmap(const_cast<char*>(data), size);
        }
        if (fd >= 0) ::close(fd);
        data = nullptr;
        size = 0;
        fd = -1;
    }
};

bool mapFileReadOnly(const std::string& path, MappedFile& mf) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) return false;
    struct stat st{};
    if (fstat(fd, &st) != 0) {
        ::close(fd);
        return false;
    }
    if (!S_ISREG(st.st_mode)) {
        ::close(fd);
        return false;
    }
    mf.fd = fd;
    if (st.st_size == 0) return true;
    void* view = mmap(nullptr, static_cast<size_t>(st.st_size), PROT_READ, MAP_PRIVATE, fd, 0);
    if (view == MAP_FAILED) {
        mf.close();
        return false;
    }
    mf.data = static_cast<const char*>(view);
    mf.size = static_cast<size_t>(st.st_size);
    return true;
}
#endif

// Reads a program file and compacts it to command characters. Returns true on
// success; on error, 'err' is set and 'out' left unchanged.
bool readProgramFile(const std::string& filename, std::string& out, std::string& err) {
#ifndef _WIN32
    MappedFile mf;
    if (mapFileReadOnly(filename, mf)) {
        out = mf.size ? bftool::sanitize(std::string_view(mf.data, mf.size)) : std::string{};
        return true;
    }
#endif
    // Fallback: stream the whole file, then compact
    std::ifstream in(filename, std::ios::binary);
    if (!in.is_open()) {
        err = "File could not be opened: " + filename;
        return false;
    }
    // istream::read turns read errors (e.g. on a directory) into badbit
    std::string raw;
    char buf[1 << 16];
    while (in.read(buf, sizeof(buf)) || in.gcount() > 0) {
        raw.append(buf, static_cast<size_t>(in.gcount()));
    }
    if (in.bad()) {
        err = "Error while reading file: " + filename;
        return false;
    }
    out = bftool::sanitize(raw);
    return true;
}

struct CmdArgs {
    std::string filename;
    std::string program;
    std::string input;
    bool hasFile = false;
    bool hasProgram = false;
    bool dumpMemory = false;
    bool profile = false;
    bool help = false;
    bool usageError = false;
    bftool::Config config{};
};

bool parseSigned(const char* val, std::int64_t& outVal) {
    char* end = nullptr;
    errno = 0;
    long long parsed = std::strtoll(val, &end, 10);
    if (end == val || *end != '\0' || errno == ERANGE) return false;
    outVal = static_cast<std::int64_t>(parsed);
    return true;
}

CmdArgs parseArgs(int argc, char* argv[]) {
    CmdArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        const bool hasValue = i + 1 < argc;
        if ((arg == "-f" || arg == "--file") && hasValue) {
            args.filename = argv[++i];
            args.hasFile = true;
        } else if ((arg == "-p" || arg == "--program") && hasValue) {
            args.program = argv[++i];
            args.hasProgram = true;
        } else if ((arg == "-i" || arg == "--input") && hasValue) {
            args.input = argv[++i];
        } else if (arg == "--tape-size" && hasValue) {
            const char* val = argv[++i];
            if (!parseSigned(val, args.config.tapeSize)) {
                std::cerr << "Tape size must be an integer: " << val << std::endl;
                args.usageError = true;
            }
        } else if (arg == "--max-steps" && hasValue) {
            const char* val = argv[++i];
            std::int64_t parsed = 0;
            if (!parseSigned(val, parsed) || parsed <= 0) {
                std::cerr << "Max steps must be a positive integer: " << val << std::endl;
                args.usageError = true;
            } else {
                args.config.maxSteps = static_cast<std::uint64_t>(parsed);
            }
        } else if (arg == "-dm" || arg == "--dump-memory") {
            args.dumpMemory = true;
        } else if (arg == "--profile") {
            args.profile = true;
        } else if (arg == "-h" || arg == "--help") {
            args.help = true;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            args.usageError = true;
        }
    }
    if (!args.help && !args.usageError && args.hasFile == args.hasProgram) {
        std::cerr << "Exactly one of -f <file> or -p <program> is required" << std::endl;
        args.usageError = true;
    }
    return args;
}

void printHelp(const char* prog, std::ostream& out) {
    out << "Usage: " << prog << " (-f <file> | -p <program>) [options]\n"
        << "Options:\n"
        << "  -f, --file <path>     Execute code from file\n"
        << "  -p, --program <code>  Execute code given directly (markup/noise allowed)\n"
        << "  -i, --input <text>    Input consumed by ','\n"
        << "  --tape-size <n>       Tape size in cells (default " << BFTOOL_DEFAULT_TAPE_SIZE
        << ")\n"
        << "  --max-steps <n>       Step limit (default " << BFTOOL_DEFAULT_MAX_STEPS << ")\n"
        << "  -dm, --dump-memory    Dump memory after program\n"
        << "  --profile             Print execution profile\n"
        << "  -h, --help            Show this help message" << std::endl;
}
}  // namespace

int main(int argc, char* argv[]) {
    CmdArgs opts = parseArgs(argc, argv);
    if (opts.help) {
        printHelp(argv[0], std::cout);
        return 0;
    }
    if (opts.usageError) {
        printHelp(argv[0], std::cerr);
        return kExitUsage;
    }

    const std::int64_t tapeSize = opts.config.tapeSize;
    if (tapeSize > 0) {
        if (static_cast<std::uint64_t>(tapeSize) > BFTOOL_TAPE_MAX_BYTES) {
            reportError("Requested tape exceeds maximum allowed size (" +
                        std::to_string(BFTOOL_TAPE_MAX_BYTES >> 20) + " MiB)");
            return kExitFailure;
        }
        if (static_cast<std::uint64_t>(tapeSize) > BFTOOL_TAPE_WARN_BYTES) {
            reportWarning("Tape allocation ~" + std::to_string(tapeSize >> 20) +
                          " MiB may exceed system memory");
        }
    }

    std::string code;
    if (opts.hasProgram) {
        code = std::move(opts.program);
    } else {
        std::string err;
        if (!readProgramFile(opts.filename, code, err)) {
            reportError(err);
            return kExitFailure;
        }
    }

    auto interp = bftool::Interpreter::create(opts.config);
    if (!interp) {
        reportError(bftool::describe(interp.error()));
        return kExitFailure;
    }
    bftool::ProfileInfo prof;
    auto result = interp.value().run(code, opts.input, opts.profile ? &prof : nullptr);
    int status = 0;
    if (result) {
        const std::string& out = result.value();
        std::cout.write(out.data(), static_cast<std::streamsize>(out.size()));
        std::cout.flush();
    } else {
        reportError(bftool::describe(result.error()));
        status = kExitFailure;
    }
    if (opts.dumpMemory) {
#ifdef _WIN32
        const bool color = false;
#else
        const bool color = isatty(STDOUT_FILENO) != 0;
#endif
        bftool::dumpMemory(interp.value().tape(), interp.value().cursor(), std::cout, color);
    }
    if (opts.profile) {
        std::cout << "Instructions executed: " << prof.instructions << std::endl;
        std::cout << "Elapsed time: " << prof.seconds << "s" << std::endl;
    }
    return status;
}
