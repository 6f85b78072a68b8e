#include "drover/console/console_loop.hpp"

#include <string>

namespace drover {

ConsoleLoop::ConsoleLoop(const CommandRegistry& registry, CommandContext& context)
    : dispatcher_(registry), context_(context) {}

int ConsoleLoop::run(std::istream& in) {
    context_.out << context_.commands.formatHelp() << std::endl;

    std::string line;
    while (true) {
        context_.out << prompt << std::flush;

        if (!std::getline(in, line)) {
            context_.out << std::endl << "CLI closed." << std::endl;
            return 0;
        }

        dispatcher_.dispatch(line, context_);

        if (context_.exitRequested) {
            return context_.exitCode;
        }
    }
}

}  // namespace drover
