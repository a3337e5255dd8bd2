#include "cli/oob_cli.hpp"
#include "common/tool_config.hpp"

int main(int argc, char** argv) {
    OobCLI cli(ToolConfigLoader::processEnvironment());
    return cli.run(argc, argv);
}
