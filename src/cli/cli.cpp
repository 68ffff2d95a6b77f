#include "cli/cli.hpp"
#include <sstream>

namespace {

// Destination used for a user typed on the command line.
Destination destination_for(UserId user_id) {
    return "user-" + std::to_string(user_id);
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

CLI::CLI(UploadPipeline& pipeline, const Config& config, std::istream& in, std::ostream& out)
    : pipeline_(pipeline), config_(config), in_(in), out_(out), running_(false) {}

void CLI::run() {
    running_ = true;
    print_help();

    std::string line;
    while (running_ && std::getline(in_, line)) {
        if (line.empty()) continue;
        running_ = handle_command(line);
    }
}

void CLI::print_help() {
    out_ << "Available commands:\n"
         << "  send <user> <ref> [--mime=<type>] [--name=<file>] [caption...]\n"
         << "                          - Queue a media item for a user\n"
         << "  discard <user>          - Drop the user's pending burst\n"
         << "  status                  - Show live sessions\n"
         << "  help                    - Show this help\n"
         << "  quit / exit             - Wait for pending work and exit\n"
         << std::endl;
}

bool CLI::handle_command(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;

    std::vector<std::string> args;
    std::string arg;
    while (iss >> arg) args.push_back(arg);

    if (cmd == "send") cmd_send(args);
    else if (cmd == "discard") cmd_discard(args);
    else if (cmd == "status") cmd_status();
    else if (cmd == "help") print_help();
    else if (cmd == "quit" || cmd == "exit") return false;
    else out_ << "Unknown command: " << cmd << std::endl;
    return true;
}

void CLI::cmd_send(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        out_ << "Usage: send <user> <ref> [--mime=<type>] [--name=<file>] [caption...]" << std::endl;
        return;
    }

    UserId user_id = 0;
    try {
        user_id = std::stoll(args[0]);
    } catch (const std::exception&) {
        out_ << "Invalid user id: " << args[0] << std::endl;
        return;
    }

    IncomingMedia media;
    media.ref = args[1];
    std::string caption;
    for (size_t i = 2; i < args.size(); ++i) {
        if (starts_with(args[i], "--mime=")) {
            media.mime_type = args[i].substr(7);
        } else if (starts_with(args[i], "--name=")) {
            media.file_name = args[i].substr(7);
        } else {
            if (!caption.empty()) caption += ' ';
            caption += args[i];
        }
    }
    if (!caption.empty()) media.caption = caption;

    try {
        MediaItem item = pipeline_.submit(user_id, destination_for(user_id), media);
        out_ << "Queued #" << item.sequence << " as " << item.display_name << item.extension
             << " for user " << user_id << " (delivery after " << config_.quiet_period.count() << "ms of quiet)" << std::endl;
    } catch (const std::exception& e) {
        out_ << "Error queueing item: " << e.what() << std::endl;
    }
}

void CLI::cmd_discard(const std::vector<std::string>& args) {
    if (args.empty()) {
        out_ << "Usage: discard <user>" << std::endl;
        return;
    }
    try {
        UserId user_id = std::stoll(args[0]);
        if (pipeline_.discard(user_id)) {
            out_ << "Discarded pending files of user " << user_id << std::endl;
        } else {
            out_ << "User " << user_id << " has nothing pending" << std::endl;
        }
    } catch (const std::exception&) {
        out_ << "Invalid user id: " << args[0] << std::endl;
    }
}

void CLI::cmd_status() {
    auto sessions = pipeline_.sessions();
    out_ << "Live sessions: " << sessions.size() << std::endl;
    for (const auto& s : sessions) {
        out_ << " - user " << s.user_id << ": " << s.items << " items, " << s.in_flight << " downloading"
             << (s.finalizing ? ", building" : "") << std::endl;
    }
    out_ << "Outbox: " << config_.outbox_dir.string() << std::endl;
}
