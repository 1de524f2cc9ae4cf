#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include "core/Environment.hpp"
#include "fs/HostFileSystem.hpp"
#include "fs/PathResolver.hpp"
#include "shell/Interpreter.hpp"
#include "shell/Repl.hpp"
#include "system/LinuxSystemMetrics.hpp"

static void usage(std::ostream& os) {
    os << "usage: pseudoshell [--cwd DIR] [-c LINE]\n"
          "  --cwd DIR   start in DIR (default: the system temp directory)\n"
          "  -c LINE     run a single line, print its output and exit with its code\n";
}

static std::string default_cwd() {
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    return ec ? std::string("/tmp") : tmp.string();
}

int main(int argc, char** argv) {
    std::string cwd = default_cwd();
    std::string one_shot;
    bool has_one_shot = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--help") { usage(std::cout); return 0; }
        if (a == "--cwd" && i + 1 < argc) { cwd = argv[++i]; continue; }
        if (a == "-c" && i + 1 < argc) { one_shot = argv[++i]; has_one_shot = true; continue; }
        std::cerr << "pseudoshell: unknown argument: " << a << std::endl;
        usage(std::cerr);
        return 2;
    }

    cwd = PathResolver::resolve(cwd, std::filesystem::current_path().string());
    std::error_code ec;
    std::filesystem::create_directories(cwd, ec);
    if (ec) std::cerr << "warning: cannot create " << cwd << ": " << ec.message() << std::endl;

    Environment env = Environment::from_process();
    HostFileSystem fs;
    LinuxSystemMetrics metrics;
    Interpreter interpreter(fs, metrics, env);

    if (has_one_shot) {
        auto result = interpreter.execute(one_shot, cwd);
        std::cout << result.out << std::flush;
        std::cerr << result.err << std::flush;
        return result.code;
    }

    Repl repl(std::cin, std::cout, std::cerr, interpreter, cwd);
    return repl.run();
}
