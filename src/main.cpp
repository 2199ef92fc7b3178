#include "binfill/config.hpp"
#include "binfill/error.hpp"
#include "binfill/generation_session.hpp"

#include <exception>
#include <iostream>

#include <fmt/format.h>

int main(int argc, char** argv) {
    try {
        const auto command_line = binfill::parseCommandLine(argc, argv);
        if (command_line.show_help) {
            binfill::printUsage(std::cout, argv[0]);
            return 0;
        }

        binfill::GenerationSession session(command_line.config);
        const auto result = session.run();
        if (!result) {
            return 1;
        }

        //单个文件失败不影响退出码, 失败列表已在汇总中打印
        std::cout << fmt::format("Done: {} files written, {} failed",
                                 result->pool.completed, result->pool.failed.size()) << std::endl;
    } catch (const binfill::ConfigError& ex) {
        std::cerr << "Configuration error: " << ex.what() << std::endl;
        binfill::printUsage(std::cerr, argv[0]);
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
