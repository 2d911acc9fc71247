#include "pystyle/application/pystyle_app.hpp"
#include "pystyle/io/file_system.hpp"
#include "pystyle/ui/report_printer.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <unistd.h>

namespace {

auto print_usage() -> void {
    std::cout << "Usage: pystyle [options] <file>...\n";
    std::cout << "  -a, --auto, --auto-correct   Apply automatic corrections and write files\n";
    std::cout << "      --dry-run                With --auto, report corrections without writing\n";
    std::cout << "      --no-color               Plain text output\n";
    std::cout << "  -l, --local-package NAME     Treat NAME as first-party (repeatable)\n";
    std::cout << "  -h, --help                   Show this help\n";
    std::cout << "\nExit status: 0 clean, 1 violations remain, 2 usage or I/O error\n";
    std::cout << "\nExamples:\n";
    std::cout << "  pystyle app.py                        # Report violations\n";
    std::cout << "  pystyle --auto src/*.py               # Fix what can be fixed safely\n";
    std::cout << "  pystyle --auto --dry-run -l myapp x.py  # Preview, myapp imports are local\n";
}

auto parse_args(int argc, char* argv[]) -> std::optional<pystyle::Config> {
    pystyle::Config config;
    config.use_color = isatty(STDOUT_FILENO) != 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-a" || arg == "--auto" || arg == "--auto-correct") {
            config.auto_correct = true;
        } else if (arg == "--dry-run") {
            config.dry_run = true;
        } else if (arg == "--no-color") {
            config.use_color = false;
        } else if (arg == "-l" || arg == "--local-package") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a package name\n";
                return std::nullopt;
            }
            config.local_packages.emplace_back(argv[++i]);
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            std::exit(pystyle::exit_clean);
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: unknown option " << arg << "\n";
            return std::nullopt;
        } else {
            config.files.push_back(arg);
        }
    }

    if (config.dry_run && !config.auto_correct) {
        std::cerr << "Warning: --dry-run has no effect without --auto\n";
    }
    return config;
}

} // namespace

auto main(int argc, char* argv[]) -> int {
    auto config = parse_args(argc, argv);
    if (!config) {
        print_usage();
        return pystyle::exit_error;
    }

    auto filesystem = std::make_unique<pystyle::FileSystem>();
    auto printer =
        std::make_unique<pystyle::TerminalReportPrinter>(std::cout, std::cerr, config->use_color);

    pystyle::PystyleApp app(std::move(filesystem), std::move(printer));
    return app.run(*config);
}
