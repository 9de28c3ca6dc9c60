#pragma once

#include <filesystem>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>
#include "tessera/network/message.hpp"
#include "tessera/sync/sync_client.hpp"

namespace tessera {
namespace cli {

// File name for delivered content inside the output directory: the last path
// component of name, or the content id when that is empty or unusable
std::string safe_file_name(const std::string& name, const std::string& content_id);

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(sync::SyncClient& client, const std::filesystem::path& output_dir,
        std::istream& input = std::cin, std::ostream& output = std::cout);


    // ---- STARTUP ----
    void run();
    // Executes one command line, false when the shell should exit
    bool process_line(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    sync::SyncClient& client_;
    std::filesystem::path output_dir_;
    std::istream& input_;
    std::ostream& output_;
    // Events arrive on connection threads
    std::mutex output_mutex_;


    // ---- COMMAND PROCESSING ----
    void handle_send_command(const std::string& path);
    void handle_text_command(const std::string& text);
    void handle_rename_command(const std::vector<std::string>& args);
    void handle_status_command();
    void handle_help_command();
    void report(bool sent, const std::string& what);
    void print(const std::string& line);
    void log_and_display_error(const std::string& message, const std::string& error);


    // ---- EVENT DISPLAY ----
    void on_event(const network::Message& message);
    void on_download(const network::ContentInfo& info, const std::vector<uint8_t>& plaintext);
    static std::string describe(const network::ContentInfo& info);
};

} // namespace cli
} // namespace tessera
