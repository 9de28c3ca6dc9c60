#include "tessera/cli/cli.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>
#include <iterator>
#include <sstream>
#include <cstdlib>

namespace tessera {
namespace cli {

namespace {
const char* const TEXT_TYPE = "text/plain";
const char* const FILE_TYPE = "application/octet-stream";
}

std::string safe_file_name(const std::string& name, const std::string& content_id) {
  const std::string base = std::filesystem::path(name).filename().string();
  if (base.empty() || base == "." || base == "..") {
    return content_id;
  }
  return base;
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(sync::SyncClient& client, const std::filesystem::path& output_dir,
         std::istream& input, std::ostream& output)
  : running_(false)
  , client_(client)
  , output_dir_(output_dir)
  , input_(input)
  , output_(output) {
  client_.set_event_handler([this](const network::Message& message) { on_event(message); });
  client_.tracker().set_completion_handler(
      [this](const network::ContentInfo& info, const std::vector<uint8_t>& plaintext) { on_download(info, plaintext); });
  client_.tracker().set_state_handler(
      [this](const std::string& id, transfer::Direction direction, transfer::TransferState::State state,
             const std::string& detail) {
        if (state == transfer::TransferState::State::FAILED || state == transfer::TransferState::State::CANCELLED ||
            (state == transfer::TransferState::State::COMPLETE && direction == transfer::Direction::UPLOAD)) {
          print(transfer::to_string(direction) + " " + id + " " +
                transfer::TransferState::state_to_string(state) + (detail.empty() ? "" : ": " + detail));
        }
      });
  BOOST_LOG_TRIVIAL(info) << "CLI initialized, downloads go to " << output_dir_;
}

//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  handle_help_command();
  print("tessera> ");

  while (running_ && std::getline(input_, line)) {
    running_ = process_line(line);
    if (running_) {
      print("tessera> ");
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

//==============================================
// COMMAND PROCESSING
//==============================================

bool CLI::process_line(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  iss >> command;
  if (command.empty()) {
    return true;
  }

  std::vector<std::string> args;
  for (std::string arg; iss >> arg;) {
    args.push_back(arg);
  }
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  if (command == "quit") {
    return false;
  } else if (command == "help") {
    handle_help_command();
  } else if (command == "send" && args.size() == 1) {
    handle_send_command(args[0]);
  } else if (command == "text" && !args.empty()) {
    const auto start = line.find_first_not_of(' ', line.find("text") + 4);
    handle_text_command(start == std::string::npos ? std::string() : line.substr(start));
  } else if (command == "list") {
    const uint32_t offset = args.empty() ? 0 : static_cast<uint32_t>(std::strtoul(args[0].c_str(), nullptr, 10));
    report(client_.list_content(offset, 0), "list request");
  } else if (command == "remove" && args.size() == 1) {
    report(client_.remove_content(args[0]), "remove request for " + args[0]);
  } else if (command == "clear" && args.empty()) {
    report(client_.clear_all(), "clear request");
  } else if (command == "rename" && args.size() >= 2) {
    handle_rename_command(args);
  } else if (command == "pin" && args.size() == 1) {
    report(client_.pin_content(args[0], true), "pin request for " + args[0]);
  } else if (command == "unpin" && args.size() == 1) {
    report(client_.pin_content(args[0], false), "unpin request for " + args[0]);
  } else if (command == "cancel" && args.size() == 1) {
    print(client_.cancel(args[0]) ? "Cancelled " + args[0] + "\n" : "No active transfer " + args[0] + "\n");
  } else if (command == "status" && args.empty()) {
    handle_status_command();
  } else if (command == "health" && args.empty()) {
    report(client_.request_health(), "health check");
  } else {
    print("Unknown command or invalid arguments, type help\n");
  }
  return true;
}

void CLI::handle_send_command(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    print("Error opening file: " + path + "\n");
    return;
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  try {
    const auto id = client_.send_content(bytes, FILE_TYPE, std::filesystem::path(path).filename().string());
    print("Uploading " + path + " as " + id + "\n");
  } catch (const std::exception& e) {
    log_and_display_error("Error sending file", e.what());
  }
}

void CLI::handle_text_command(const std::string& text) {
  try {
    const auto id = client_.send_content(std::vector<uint8_t>(text.begin(), text.end()), TEXT_TYPE, "");
    print("Sending text as " + id + "\n");
  } catch (const std::exception& e) {
    log_and_display_error("Error sending text", e.what());
  }
}

void CLI::handle_rename_command(const std::vector<std::string>& args) {
  std::string name = args[1];
  for (std::size_t i = 2; i < args.size(); ++i) {
    name += " " + args[i];
  }
  report(client_.rename_content(args[0], name), "rename request for " + args[0]);
}

void CLI::handle_status_command() {
  std::ostringstream out;
  out << (client_.is_connected() ? "Connected" : "Disconnected") << "\n";
  const auto transfers = client_.tracker().snapshot();
  if (transfers.empty()) {
    out << "No transfers\n";
  }
  for (const auto& transfer : transfers) {
    out << "  " << transfer::to_string(transfer.direction) << " " << transfer.content_id << " "
        << transfer.state << " " << transfer.progress.acknowledged << "/" << transfer.progress.total;
    if (!transfer.name.empty()) {
      out << " " << transfer.name;
    }
    if (!transfer.error.empty()) {
      out << " (" << transfer.error << ")";
    }
    out << "\n";
  }
  print(out.str());
}

void CLI::handle_help_command() {
  print("Available commands:\n"
        "  send <file>          Upload a file\n"
        "  text <message>       Send a text message\n"
        "  list [offset]        List session content, newest first\n"
        "  remove <id>          Delete one item for everyone\n"
        "  clear                Delete all session content\n"
        "  rename <id> <name>   Rename an item\n"
        "  pin <id>             Exempt an item from retention\n"
        "  unpin <id>           Make an item subject to retention again\n"
        "  cancel <id>          Stop an active transfer\n"
        "  status               Show connection and transfers\n"
        "  health               Ask the server for its health\n"
        "  help                 Display this help message\n"
        "  quit                 Exit\n");
}

void CLI::report(bool sent, const std::string& what) {
  if (!sent) {
    print("Not connected, " + what + " not sent\n");
  }
}

void CLI::print(const std::string& line) {
  std::lock_guard<std::mutex> lock(output_mutex_);
  output_ << line << std::flush;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  print(message + ": " + error + "\n");
}

//==============================================
// EVENT DISPLAY
//==============================================

void CLI::on_event(const network::Message& message) {
  switch (message.type) {
    case network::MessageType::CONTENT_PAGE: {
      const auto& page = message.as<network::ContentPage>();
      std::ostringstream out;
      out << "Content " << page.offset + 1 << "-" << page.offset + page.items.size() << " of " << page.total << "\n";
      for (const auto& info : page.items) {
        out << "  " << describe(info) << "\n";
      }
      print(out.str());
      break;
    }
    case network::MessageType::CONTENT_REMOVED:
      print("Removed " + message.as<network::ContentRemoved>().content_id + "\n");
      break;
    case network::MessageType::CONTENT_UPDATED:
      print("Updated " + describe(message.as<network::ContentUpdated>().info) + "\n");
      break;
    case network::MessageType::SESSION_CLEARED:
      print("Session cleared\n");
      break;
    case network::MessageType::SESSION_EXPIRED:
      print("Session expired\n");
      break;
    case network::MessageType::CLIENT_JOINED:
      print(message.as<network::ClientJoined>().client_name + " joined\n");
      break;
    case network::MessageType::CLIENT_LEFT:
      print(message.as<network::ClientLeft>().client_name + " left\n");
      break;
    case network::MessageType::HEALTH_STATUS: {
      const auto& status = message.as<network::HealthStatus>();
      print(std::string("Server ") + (status.healthy ? "healthy" : "unhealthy") + ": " + status.detail + "\n");
      break;
    }
    case network::MessageType::ERROR: {
      const auto& error = message.as<network::ErrorMessage>();
      print("Server error (" + network::to_string(error.code) + "): " + error.reason + "\n");
      break;
    }
    default:
      break;
  }
}

void CLI::on_download(const network::ContentInfo& info, const std::vector<uint8_t>& plaintext) {
  if (info.content_type == TEXT_TYPE) {
    print("Message " + info.content_id + ": " + std::string(plaintext.begin(), plaintext.end()) + "\n");
    return;
  }

  try {
    std::filesystem::create_directories(output_dir_);
    const auto path = output_dir_ / safe_file_name(info.name, info.content_id);
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(plaintext.data()), static_cast<std::streamsize>(plaintext.size()));
    if (!file) {
      log_and_display_error("Error writing download", path.string());
      return;
    }
    print("Received " + describe(info) + " -> " + path.string() + "\n");
  } catch (const std::filesystem::filesystem_error& e) {
    log_and_display_error("Error writing download", e.what());
  }
}

std::string CLI::describe(const network::ContentInfo& info) {
  std::ostringstream out;
  out << info.content_id << " " << info.content_type;
  if (!info.name.empty()) {
    out << " \"" << info.name << "\"";
  }
  out << " " << info.total_size << " bytes";
  if (info.pinned) {
    out << " [pinned]";
  }
  return out.str();
}

} // namespace cli
} // namespace tessera
