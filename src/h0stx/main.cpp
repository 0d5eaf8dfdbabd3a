#include "commands/check.hpp"
#include "commands/families.hpp"
#include "commands/info.hpp"

#include <iostream>
#include <optional>
#include <string>

#include <args.hxx>
#include <redlog.hpp>

#include "h0st/core/config.hpp"
#include "h0st/core/verbosity.hpp"

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});

// -v flags and H0ST_VERBOSE, whichever asks for more
void apply_verbosity() {
  h0st::apply_verbosity(h0st::effective_verbosity(args::get(verbosity_flag), h0st::host_config::from_environment()));
}
} // namespace cli

namespace {

std::optional<std::string> optional_value(args::ValueFlag<std::string>& flag) {
  if (!flag) {
    return std::nullopt;
  }
  return args::get(flag);
}

} // namespace

int cmd_info() {
  cli::apply_verbosity();
  return h0stx::commands::info_command();
}

int cmd_families() {
  cli::apply_verbosity();
  return h0stx::commands::families_command();
}

int cmd_check(
    args::ValueFlag<std::string>& family_flag, args::ValueFlag<std::string>& name_flag,
    args::ValueFlag<std::string>& arch_flag, args::ValueFlag<std::string>& version_flag, args::Flag& quiet_flag
) {
  cli::apply_verbosity();

  h0stx::commands::check_request request;
  request.family = optional_value(family_flag);
  request.name = optional_value(name_flag);
  request.arch = optional_value(arch_flag);
  request.version = optional_value(version_flag);
  request.quiet = args::get(quiet_flag);
  return h0stx::commands::check_command(request);
}

int main(int argc, char* argv[]) {
  args::ArgumentParser parser("h0stx - host os family classifier");
  parser.helpParams.showTerminator = false;
  parser.helpParams.helpindent = 2;
  parser.helpParams.width = 120;

  // global flags
  parser.Add(cli::arguments);

  // info command
  args::Command info_cmd(parser, "info", "show host name, arch, version and family");

  // families command
  args::Command families_cmd(parser, "families", "list os families (* resolved, + also matching)");

  // check command
  args::Command check_cmd(parser, "check", "test the host against a query (exit 0 match, 1 no match, 2 error)");
  args::ValueFlag<std::string> check_family_flag(check_cmd, "family", "os family, e.g. unix or winnt", {'f', "family"});
  args::ValueFlag<std::string> check_name_flag(check_cmd, "name", "exact os name", {'n', "name"});
  args::ValueFlag<std::string> check_arch_flag(check_cmd, "arch", "exact architecture", {'a', "arch"});
  args::ValueFlag<std::string> check_version_flag(check_cmd, "version", "exact os version", {"version"});
  args::Flag check_quiet_flag(check_cmd, "quiet", "only set the exit code", {'q', "quiet"});

  try {
    parser.ParseCLI(argc, argv);

    if (info_cmd) {
      return cmd_info();
    } else if (families_cmd) {
      return cmd_families();
    } else if (check_cmd) {
      return cmd_check(check_family_flag, check_name_flag, check_arch_flag, check_version_flag, check_quiet_flag);
    } else {
      std::cerr << "error: no command specified" << std::endl;
      std::cerr << parser;
      return 2;
    }

  } catch (const args::Help&) {
    std::cout << parser;
    return 0;
  } catch (const args::ParseError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << parser;
    return 2;
  } catch (const args::ValidationError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << parser;
    return 2;
  }

  return 0;
}
