#include "taskweave/cli/commands.hpp"
#include "taskweave/config/config.hpp"
#include "taskweave/util/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <print>
#include <string>
#include <string_view>

namespace {

void print_usage(const char* prog) {
  std::println("TaskWeave - Task dependency graph engine");
  std::println("Usage: {} <command> [OPTIONS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  validate              Report dependency issues");
  std::println("  fix                   Repair dependency issues in place");
  std::println("  next                  Show tasks that can start now");
  std::println("  add-dep               Add a dependency");
  std::println("  remove-dep            Remove a dependency");
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   Config file (YAML)");
  std::println("  -f, --file <file>     Tasks file (default: tasks/tasks.json)");
  std::println("  --tag <name>          Task list to use in a tagged file");
  std::println("  -n, --count <n>       Number of parallel tasks for 'next'");
  std::println("  --id <id>             Task or subtask id ('3' or '3.1')");
  std::println("  --depends-on <id>     Dependency id for add-dep/remove-dep");
  std::println("  --dry-run             Report fixes without writing them");
  std::println("  --json                Machine-readable output");
  std::println("  --log-level <level>   trace, debug, info, warn, error, off");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
  std::println("");
  std::println("Examples:");
  std::println("  {} validate -f tasks/tasks.json", prog);
  std::println("  {} next -n 3 --json", prog);
  std::println("  {} add-dep --id 5 --depends-on 3.2", prog);
}

void print_version() {
  std::println("TaskWeave v0.1.0");
}

struct Options {
  std::string command;
  std::string config_file;
  std::string tasks_file;
  std::string tag;
  std::string log_level;
  std::optional<std::string> count;
  std::string id;
  std::string depends_on;
  bool dry_run = false;
  bool json = false;
};

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> const char* {
  if (++i >= argc) {
    std::println(stderr, "Error: {} requires an argument", flag);
    std::exit(1);
  }
  return argv[i];
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.config_file = require_value(i, argc, argv, arg);
    } else if (arg == "-f" || arg == "--file") {
      opts.tasks_file = require_value(i, argc, argv, arg);
    } else if (arg == "--tag") {
      opts.tag = require_value(i, argc, argv, arg);
    } else if (arg == "-n" || arg == "--count") {
      opts.count = require_value(i, argc, argv, arg);
    } else if (arg == "--id") {
      opts.id = require_value(i, argc, argv, arg);
    } else if (arg == "--depends-on") {
      opts.depends_on = require_value(i, argc, argv, arg);
    } else if (arg == "--log-level") {
      opts.log_level = require_value(i, argc, argv, arg);
    } else if (arg == "--dry-run") {
      opts.dry_run = true;
    } else if (arg == "--json") {
      opts.json = true;
    } else if (opts.command.empty() && !arg.starts_with("-")) {
      opts.command = arg;
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

void setup_logging(const taskweave::LogConfig& config,
                   const std::string& override_level) {
  taskweave::log::set_level(override_level.empty() ? config.level
                                                   : override_level);
  taskweave::log::logger().set_color(config.color);
  if (!config.file.empty() && !taskweave::log::logger().open_file(config.file)) {
    taskweave::log::warn("Cannot open log file {}, logging to stderr only",
                         config.file);
  }
}

auto build_context(const Options& opts) -> std::optional<taskweave::cli::Context> {
  taskweave::cli::Context ctx;

  if (!opts.config_file.empty()) {
    if (!std::filesystem::exists(opts.config_file)) {
      std::println(stderr, "Error: Config file not found: {}",
                   opts.config_file);
      return std::nullopt;
    }
    auto result = taskweave::ConfigLoader::load_from_file(opts.config_file);
    if (!result) {
      std::println(stderr, "Error: Failed to load config: {}",
                   result.error().message());
      return std::nullopt;
    }
    ctx.config = std::move(*result);
  }

  if (!opts.tasks_file.empty()) {
    ctx.config.tasks_file = opts.tasks_file;
  }
  if (!opts.tag.empty()) {
    ctx.config.tag = opts.tag;
  }
  return ctx;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  if (opts.command.empty()) {
    print_usage(argv[0]);
    return 1;
  }

  auto ctx = build_context(opts);
  if (!ctx) {
    return 1;
  }
  setup_logging(ctx->config.log, opts.log_level);

  namespace cli = taskweave::cli;
  if (opts.command == "validate") {
    return cli::cmd_validate(*ctx, {.json = opts.json});
  }
  if (opts.command == "fix") {
    return cli::cmd_fix(*ctx, {.dry_run = opts.dry_run, .json = opts.json});
  }
  if (opts.command == "next") {
    return cli::cmd_next(*ctx, {.concurrency = opts.count, .json = opts.json});
  }
  if (opts.command == "add-dep") {
    return cli::cmd_add_dep(*ctx,
                            {.id = opts.id, .depends_on = opts.depends_on});
  }
  if (opts.command == "remove-dep") {
    return cli::cmd_remove_dep(*ctx,
                               {.id = opts.id, .depends_on = opts.depends_on});
  }

  std::println(stderr, "Unknown command: {}", opts.command);
  print_usage(argv[0]);
  return 1;
}
