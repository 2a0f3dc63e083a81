// Random programs checked against a naive reference interpreter that finds
// matching brackets by scanning for depth instead of using a jump table.

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "vm.hxx"

namespace {
struct Outcome {
    bool ok = false;
    std::string output;
    bftool::Error error{bftool::ErrorKind::Configuration};
};

size_t matchForward(const std::string& code, size_t open) {
    int depth = 0;
    for (size_t i = open; i < code.size(); ++i) {
        if (code[i] == '[') ++depth;
        if (code[i] == ']' && --depth == 0) return i;
    }
    return std::string::npos;
}

size_t matchBackward(const std::string& code, size_t close) {
    int depth = 0;
    for (size_t i = close + 1; i-- > 0;) {
        if (code[i] == ']') ++depth;
        if (code[i] == '[' && --depth == 0) return i;
    }
    return std::string::npos;
}

Outcome reference(const std::string& code, const std::string& input, size_t tapeSize,
                  std::uint64_t maxSteps) {
    Outcome res;
    int depth = 0;
    for (size_t i = 0; i < code.size(); ++i) {
        if (code[i] == '[') ++depth;
        if (code[i] == ']' && --depth < 0) {
            res.error = bftool::Error::unmatchedClose(i);
            return res;
        }
    }
    for (size_t i = code.size(); i-- > 0;) {
        if (code[i] == '[' && matchForward(code, i) == std::string::npos) {
            res.error = bftool::Error::unmatchedOpen(i);
            return res;
        }
    }
    std::vector<int> tape(tapeSize, 0);
    long ptr = 0;
    size_t in = 0;
    std::uint64_t steps = 0;
    for (size_t ip = 0; ip < code.size(); ++ip) {
        if (steps == maxSteps) {
            res.error = bftool::Error::stepLimit(maxSteps);
            return res;
        }
        ++steps;
        switch (code[ip]) {
            case '>':
                ptr = (ptr + 1) % static_cast<long>(tapeSize);
                break;
            case '<':
                ptr = (ptr - 1 + static_cast<long>(tapeSize)) % static_cast<long>(tapeSize);
                break;
            case '+':
                tape[ptr] = (tape[ptr] + 1) % 256;
                break;
            case '-':
                tape[ptr] = (tape[ptr] + 255) % 256;
                break;
            case '.':
                res.output += static_cast<char>(tape[ptr]);
                break;
            case ',':
                tape[ptr] = in < input.size() ? static_cast<unsigned char>(input[in++]) : 0;
                break;
            case '[':
                if (tape[ptr] == 0) ip = matchForward(code, ip);
                break;
            case ']':
                if (tape[ptr] != 0) ip = matchBackward(code, ip);
                break;
        }
    }
    res.ok = true;
    return res;
}

std::string randomProgram(std::mt19937& gen) {
    static const char ops[] = "+-<>.,[]+-";
    std::uniform_int_distribution<int> lenDist(0, 24);
    std::uniform_int_distribution<int> opDist(0, sizeof(ops) - 2);
    std::uniform_int_distribution<int> noiseDist(0, 9);
    const int len = lenDist(gen);
    std::string program;
    for (int i = 0; i < len; ++i) {
        program += ops[opDist(gen)];
        if (noiseDist(gen) == 0) program += ' ';
    }
    return program;
}

std::string randomInput(std::mt19937& gen) {
    std::uniform_int_distribution<int> lenDist(0, 8);
    std::uniform_int_distribution<int> byteDist(0, 255);
    const int len = lenDist(gen);
    std::string input;
    for (int i = 0; i < len; ++i) input += static_cast<char>(byteDist(gen));
    return input;
}
}  // namespace

int main() {
    std::mt19937 gen(123456u);
    std::uniform_int_distribution<int> tapeDist(1, 8);
    std::atomic_bool done{false};
    std::thread watchdogThread([&done]() {
        for (int i = 0; i < 30000; ++i) {
            if (done.load()) return;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        std::terminate();
    });
    for (int i = 0; i < 2000; ++i) {
        const std::string code = randomProgram(gen);
        const std::string input = randomInput(gen);
        bftool::Config cfg;
        cfg.tapeSize = tapeDist(gen);
        cfg.maxSteps = 5000;
        auto interp = bftool::Interpreter::create(cfg);
        assert(interp.ok());
        auto result = interp.value().run(code, input);
        const Outcome expected = reference(bftool::sanitize(code), input,
                                           static_cast<size_t>(cfg.tapeSize), cfg.maxSteps);
        assert(result.ok() == expected.ok);
        if (expected.ok) {
            assert(result.value() == expected.output);
        } else {
            assert(result.error() == expected.error);
        }
    }
    done = true;
    watchdogThread.join();
    return 0;
}
