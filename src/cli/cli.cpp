#include "cli/cli.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <boost/log/trivial.hpp>
#include "error/error.hpp"

namespace hold {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(provider::AsyncProvider& provider, std::istream& input, std::ostream& output)
  : provider_(provider)
  , input_(input)
  , output_(output)
  , running_(false) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized for " << provider_.provider().name();
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  output_ << "hold> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    std::istringstream iss(line);
    std::string command, first, second;
    iss >> command >> first >> second;

    if (command == "quit") {
      running_ = false;
      continue;
    }
    if (!command.empty()) {
      process_command(command, first, second);
    }

    if (running_) {
      output_ << "hold> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::string& first,
                          const std::string& second) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " " << first << " " << second;

  if (command == "help") {
    handle_help_command();
  }
  else if (command == "store" && !first.empty()) {
    handle_store_command(first, second.empty() ? first : second);
  }
  else if (command == "get" && !first.empty()) {
    handle_get_command(first, second);
  }
  else if (command == "has" && !first.empty()) {
    handle_has_command(first);
  }
  else if (command == "delete" && !first.empty()) {
    handle_delete_command(first);
  }
  else {
    output_ << "Unknown command or invalid arguments, type 'help' for usage" << std::endl;
  }
}

void CLI::handle_store_command(const std::string& filename, const std::string& key) {
  std::error_code ec;
  std::uintmax_t size = std::filesystem::file_size(filename, ec);
  auto file = std::make_unique<std::ifstream>(filename, std::ios::binary);
  if (ec || !*file) {
    output_ << "Error opening file: " << filename << std::endl;
    return;
  }

  try {
    blob::Blob blob(key, size, blob::ByteStream::from_istream(std::move(file)));
    blob::Blob stored = provider_.store_blob(std::move(blob)).get();
    output_ << "Stored " << stored.key() << " (" << stored.size() << " bytes)" << std::endl;
  } catch (const error::Error& e) {
    log_and_display_error("Error storing blob", e.what());
  }
}

void CLI::handle_get_command(const std::string& key, const std::string& filename) {
  try {
    std::optional<blob::Blob> blob = provider_.get_blob(key).get();
    if (!blob) {
      output_ << "Blob not found: " << key << std::endl;
      return;
    }

    blob::ByteStreamPtr content = std::move(*blob).into_byte_stream();
    if (filename.empty()) {
      blob::copy_to(*content, output_);
      output_ << std::endl;
      return;
    }

    std::ofstream file(filename, std::ios::binary | std::ios::trunc);
    if (!file) {
      output_ << "Error opening file: " << filename << std::endl;
      return;
    }
    std::uint64_t bytes = blob::copy_to(*content, file);
    output_ << "Wrote " << bytes << " bytes to " << filename << std::endl;
  } catch (const error::Error& e) {
    log_and_display_error("Error reading blob", e.what());
  } catch (const std::ios_base::failure& e) {
    log_and_display_error("Error streaming blob", e.what());
  }
}

void CLI::handle_has_command(const std::string& key) {
  try {
    bool present = provider_.is_blob_present(key).get();
    output_ << key << (present ? " is present" : " is absent") << std::endl;
  } catch (const error::Error& e) {
    log_and_display_error("Error checking blob", e.what());
  }
}

void CLI::handle_delete_command(const std::string& key) {
  try {
    provider_.delete_blob(key).get();
    output_ << "Blob deleted: " << key << std::endl;
  } catch (const error::Error& e) {
    log_and_display_error("Error deleting blob", e.what());
  }
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                Display this help message" << std::endl;
  output_ << "  store <file> [key]  Store local <file>, under <key> if given" << std::endl;
  output_ << "  get <key> [file]    Print blob <key>, or write it to <file>" << std::endl;
  output_ << "  has <key>           Check whether blob <key> exists" << std::endl;
  output_ << "  delete <key>        Delete blob <key>" << std::endl;
  output_ << "  quit                Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace hold
