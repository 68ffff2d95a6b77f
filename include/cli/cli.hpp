#ifndef BURSTPACK_CLI_HPP
#define BURSTPACK_CLI_HPP

#include <iostream>
#include <string>
#include <vector>

#include "../common/config.hpp"
#include "../pipeline/upload_pipeline.hpp"

class CLI {
public:
    CLI(UploadPipeline& pipeline, const Config& config,
        std::istream& in = std::cin, std::ostream& out = std::cout);

    // Reads commands until quit/exit or end of input.
    void run();

    // Returns false once the user asked to quit.
    bool handle_command(const std::string& line);

private:
    void print_help();

    void cmd_send(const std::vector<std::string>& args);
    void cmd_discard(const std::vector<std::string>& args);
    void cmd_status();

    UploadPipeline& pipeline_;
    const Config& config_;
    std::istream& in_;
    std::ostream& out_;
    bool running_;
};

#endif // BURSTPACK_CLI_HPP
