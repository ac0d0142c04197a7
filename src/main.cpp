#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include "cli/cli.hpp"
#include "fs/fs_provider.hpp"
#include "logger/logger.hpp"
#include "memory/memory_provider.hpp"
#include "provider/async_provider.hpp"
#include "s3/s3_provider.hpp"

struct ProgramOptions {
  std::string backend;
  std::string root{"hold_store"};
  hold::s3::S3Config s3;
  std::string log_file{"hold.log"};
  std::string log_level{"info"};
  std::size_t threads{hold::provider::AsyncProvider::DEFAULT_THREADS};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " --backend <memory|fs|s3> [options]\n"
        << "Filesystem options:\n"
        << "  --root <dir>         Base directory (default: hold_store)\n"
        << "S3 options:\n"
        << "  --bucket <name>      Bucket name (required)\n"
        << "  --endpoint <url>     Service endpoint, e.g. http://127.0.0.1:9000\n"
        << "  --region <region>    Region (default: AWS_REGION or us-east-1)\n"
        << "  --path-style         Address the bucket in the path\n"
        << "General options:\n"
        << "  --threads <n>        Worker threads (default: 4)\n"
        << "  --log-file <file>    Log file (default: hold.log)\n"
        << "  --log-level <level>  trace, debug, info, warning, error, fatal\n"
        << "Credentials are read from AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY.\n"
        << "Example: " << program_name << " --backend s3 --bucket blobs --endpoint http://127.0.0.1:9000\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  ProgramOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "--path-style") {
      options.s3.path_style = true;
      continue;
    }

    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    const std::string value(argv[++i]);

    if (flag == "--backend") {
      options.backend = value;
    } else if (flag == "--root") {
      options.root = value;
    } else if (flag == "--bucket") {
      options.s3.bucket = value;
    } else if (flag == "--endpoint") {
      options.s3.endpoint = value;
    } else if (flag == "--region") {
      options.s3.region = value;
    } else if (flag == "--log-file") {
      options.log_file = value;
    } else if (flag == "--log-level") {
      options.log_level = value;
    } else if (flag == "--threads") {
      try {
        options.threads = static_cast<std::size_t>(std::stoul(value));
      } catch (const std::exception&) {
        std::cerr << "Error: Invalid thread count\n";
        print_usage(argv[0]);
        return options;
      }
    } else {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  if (options.backend != "memory" && options.backend != "fs" && options.backend != "s3") {
    std::cerr << "Error: --backend must be one of memory, fs, s3\n";
    print_usage(argv[0]);
    return options;
  }
  if (options.backend == "s3" && options.s3.bucket.empty()) {
    std::cerr << "Error: --bucket is required for the s3 backend\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

std::shared_ptr<hold::provider::Provider> make_provider(const ProgramOptions& options) {
  if (options.backend == "fs") {
    return std::make_shared<hold::fs::FilesystemProvider>(options.root);
  }
  if (options.backend == "s3") {
    return std::make_shared<hold::s3::S3Provider>(options.s3);
  }
  return std::make_shared<hold::memory::MemoryProvider>();
}

bool run_shell(const ProgramOptions& options) {
  try {
    hold::logging::init_logging(options.log_file, hold::logging::parse_severity(options.log_level));

    hold::provider::AsyncProvider provider(make_provider(options), options.threads);
    hold::cli::CLI cli(provider);
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start hold: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
