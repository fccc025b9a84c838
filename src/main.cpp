#include "pedbg/Debugger.h"
#include "backends/WindowsBackend.h"
#include "platform/Platform.h"
#include <iostream>

int main(int argc, char **argv) {
    if (argc < 2) {
        std::cout << "Usage: " << argv[0] << " <Command-Line>" << std::endl;
        return 0;
    }

    std::vector<std::string> target(argv + 1, argv + argc);

    pedbg::Debugger dbg(std::make_unique<pedbg::WindowsBackend>(), std::cin, std::cout);

    auto logSetting = pedbg_internal::getEnvironment("PEDBG_LOG");
    if (logSetting && !logSetting->empty() && *logSetting != "0") {
        dbg.setLogCallback([](const std::string &m){ std::cerr << "[LOG] " << m << std::endl; });
    }
    dbg.setSymbolOptions(pedbg::SymbolOptions::fromEnvironment());

    std::string commandLine;
    for (const auto &arg : target) {
        if (!commandLine.empty()) commandLine += " ";
        commandLine += arg;
    }
    std::cout << "Debugging " << commandLine << "\n" << std::endl;

    if (dbg.launch(target) != pedbg::Status::Ok) {
        std::cerr << "fatal: " << dbg.getLastError() << std::endl;
        return 1;
    }

    if (dbg.run() != pedbg::Status::Ok) {
        std::cerr << "fatal: " << dbg.getLastError() << std::endl;
        return 1;
    }
    return 0;
}
