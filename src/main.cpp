#include "workgraph/cli/commands.hpp"

#include <fmt/format.h>

#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage(const char* prog) {
  fmt::print("workgraph - Dependency graph maintenance for task lists\n");
  fmt::print("Usage: {} [OPTIONS] <command> [ARGS]\n", prog);
  fmt::print("\n");
  fmt::print("Commands:\n");
  fmt::print("  validate                      Report missing, self and "
             "circular dependencies\n");
  fmt::print("  fix                           Repair the dependency graph\n");
  fmt::print("  add <task> <dep>              Make <task> depend on <dep>\n");
  fmt::print("  remove <task> <dep>           Remove a dependency\n");
  fmt::print("  add-range <tasks> <deps>      Add every pair, e.g. 7-10 1,3\n");
  fmt::print("  remove-range <tasks> <deps>   Remove every pair\n");
  fmt::print("  next                          Show the next eligible task\n");
  fmt::print("\n");
  fmt::print("Options:\n");
  fmt::print("  -c, --config <file>   Config file (default: workgraph.yaml "
             "if present)\n");
  fmt::print("  --store <backend>     Task store backend: json or sqlite\n");
  fmt::print("  -f, --file <path>     Tasks file or database\n");
  fmt::print("  --log-level <level>   trace, debug, info, warn, error, off\n");
  fmt::print("  --dry-run             Only report what a range command "
             "would do\n");
  fmt::print("  -v, --version         Show version and exit\n");
  fmt::print("  -h, --help            Show this help message\n");
  fmt::print("\n");
  fmt::print("Examples:\n");
  fmt::print("  {} validate\n", prog);
  fmt::print("  {} add 5 3\n", prog);
  fmt::print("  {} add-range 7-10 4.1-4.3 --dry-run\n", prog);
  fmt::print("  {} --store sqlite -f tasks.db next\n", prog);
}

void print_version() {
  fmt::print("workgraph v0.1.0\n");
}

struct Options {
  workgraph::cli::CommonOptions common;
  std::string command;
  std::vector<std::string> args;
  bool dry_run = false;
};

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> std::string {
  if (++i >= argc) {
    fmt::print(stderr, "Error: {} requires an argument\n", flag);
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
      opts.common.config_file = require_value(i, argc, argv, arg);
    } else if (arg == "--store") {
      auto name = require_value(i, argc, argv, arg);
      auto backend = workgraph::string_to_store_backend(name);
      if (!backend) {
        fmt::print(stderr, "Error: unknown store backend '{}'\n", name);
        std::exit(1);
      }
      opts.common.backend = *backend;
    } else if (arg == "-f" || arg == "--file") {
      opts.common.store_path = require_value(i, argc, argv, arg);
    } else if (arg == "--log-level") {
      opts.common.log_level = require_value(i, argc, argv, arg);
    } else if (arg == "--dry-run") {
      opts.dry_run = true;
    } else if (arg.size() > 1 && arg.front() == '-' &&
               !(arg[1] >= '0' && arg[1] <= '9')) {
      fmt::print(stderr, "Unknown option: {}\n", arg);
      print_usage(argv[0]);
      std::exit(1);
    } else if (opts.command.empty()) {
      opts.command = arg;
    } else {
      opts.args.emplace_back(arg);
    }
  }

  return opts;
}

auto expect_args(const Options& opts, std::size_t count) -> bool {
  if (opts.args.size() != count) {
    fmt::print(stderr, "Error: '{}' takes {} argument(s), got {}\n",
               opts.command, count, opts.args.size());
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);
  namespace cli = workgraph::cli;

  if (opts.command.empty()) {
    print_usage(argv[0]);
    return 1;
  }

  if (opts.dry_run && opts.command != "add-range" &&
      opts.command != "remove-range") {
    fmt::print(stderr, "Error: --dry-run applies to range commands only\n");
    return 1;
  }

  if (opts.command == "validate" || opts.command == "fix" ||
      opts.command == "next") {
    if (!expect_args(opts, 0))
      return 1;
    if (opts.command == "validate")
      return cli::cmd_validate(opts.common);
    if (opts.command == "fix")
      return cli::cmd_fix(opts.common);
    return cli::cmd_next(opts.common);
  }

  if (opts.command == "add" || opts.command == "remove") {
    if (!expect_args(opts, 2))
      return 1;
    cli::EditOptions edit{.owner = opts.args[0], .target = opts.args[1]};
    return opts.command == "add" ? cli::cmd_add(opts.common, edit)
                                 : cli::cmd_remove(opts.common, edit);
  }

  if (opts.command == "add-range" || opts.command == "remove-range") {
    if (!expect_args(opts, 2))
      return 1;
    cli::RangeOptions range{.tasks = opts.args[0],
                            .dependencies = opts.args[1],
                            .dry_run = opts.dry_run};
    return opts.command == "add-range"
               ? cli::cmd_add_range(opts.common, range)
               : cli::cmd_remove_range(opts.common, range);
  }

  fmt::print(stderr, "Unknown command: {}\n", opts.command);
  print_usage(argv[0]);
  return 1;
}
