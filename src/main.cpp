#include "config.hpp"
#include "driver.hpp"
#include "logging.hpp"
#include <fstream>
#include <iostream>
#include <string>

using namespace LimitBook;

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);

    AppConfig config;
    std::string error;
    if (!parse_command_line(argc, argv, config, error)) {
        std::cerr << argv[0] << ": " << error << "\n";
        usage(argv[0]);
        return EXIT_BAD_INPUT;
    }
    if (config.show_help) {
        usage(argv[0]);
        return EXIT_OK;
    }

    logger().set_level(config.log_level);

    if (config.input_path.empty()) {
        logger().debug("reading commands from stdin");
        return run(std::cin, std::cout, config);
    }

    std::ifstream input(config.input_path);
    if (!input) {
        logger().error("cannot open input file '", config.input_path, "'");
        return EXIT_IO_FAILURE;
    }
    logger().debug("reading commands from ", config.input_path);
    return run(input, std::cout, config);
}
