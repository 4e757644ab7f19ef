#include <pinch/cli.hpp>

#include <iostream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto opts = pinch::parse_cli(args);
    if (opts.is_err()) {
        std::cerr << opts.error().format() << "\n";
        return 1;
    }

    opts.value().stdout_tty = isatty(fileno(stdout)) != 0;
    return pinch::run(opts.value(), std::cout, std::cerr);
}
