#include <exception>
#include <iostream>
#include <memory>

#include "app/ToolServer.hpp"
#include "application/ScratchpadService.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace scratchpad;

int main() {
    std::cerr << "[main] Starting Scratchpad MCP Server..." << std::endl;

    std::unique_ptr<application::ScratchpadService> service;
    try {
        application::ScratchpadConfig config = infrastructure::ConfigLoader::Load();
        std::cerr << "[main] Workspace: " << config.root.string() << std::endl;
        service = std::make_unique<application::ScratchpadService>(std::move(config));
    } catch (const std::exception& e) {
        std::cerr << "[main] Failed to initialize scratchpad service: " << e.what() << std::endl;
        return 1;
    }

    app::ToolServer server(*service);
    server.run(std::cin, std::cout);

    std::cerr << "[main] Scratchpad MCP Server stopped" << std::endl;
    return 0;
}
