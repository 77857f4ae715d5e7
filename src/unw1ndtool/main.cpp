#include <cstdint>
#include <iostream>
#include <string>

#include <args.hxx>
#include <redlog.hpp>

#include "commands/backtrace.hpp"
#include "commands/modules.hpp"
#include "commands/rows.hpp"
#include "commands/sample.hpp"

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});
args::ValueFlag<size_t> max_frames_flag(arguments, "count", "maximum frames to walk", {'n', "max-frames"});
args::ValueFlag<std::string> walk_log_flag(arguments, "sink", "walk log sink: none, stderr, redlog", {"walk-log"});
args::ValueFlagList<std::string> skip_flag(arguments, "module", "skip a module by path or basename", {"skip"});
} // namespace cli

namespace {
auto log_main = redlog::get_logger("unw1ndtool");
int g_exit_code = 0;

// environment first, then whatever the command line overrides
bool load_common(unw1ndtool::commands::common_options& common) {
  common.config = unw1nd::config::unwind_config::from_environment();

  const int verbosity = args::get(cli::verbosity_flag);
  if (verbosity > 0) {
    common.config.verbose = verbosity;
  }
  unw1ndtool::commands::apply_verbosity(common.config.verbose);

  if (cli::max_frames_flag) {
    common.config.max_frames = args::get(cli::max_frames_flag);
  }
  for (const auto& module : args::get(cli::skip_flag)) {
    common.config.skip_modules.push_back(module);
  }
  if (cli::walk_log_flag) {
    const std::string sink = args::get(cli::walk_log_flag);
    if (sink == "none") {
      common.config.walk_log = unw1nd::config::walk_log_sink::none;
    } else if (sink == "stderr") {
      common.config.walk_log = unw1nd::config::walk_log_sink::stderr_sink;
    } else if (sink == "redlog") {
      common.config.walk_log = unw1nd::config::walk_log_sink::redlog_sink;
    } else {
      log_main.err("unknown walk log sink", redlog::field("sink", sink));
      std::cerr << "error: --walk-log must be none, stderr or redlog" << std::endl;
      return false;
    }
  }

  log_main.dbg(
      "configuration", redlog::field("max_frames", common.config.max_frames),
      redlog::field("walk_log", unw1nd::config::to_string(common.config.walk_log)),
      redlog::field("skip_modules", common.config.skip_modules.size())
  );
  return true;
}
} // namespace

void cmd_backtrace(args::Subparser& parser) {
  parser.Parse();

  unw1ndtool::commands::backtrace_options options;
  if (!load_common(options.common)) {
    g_exit_code = 1;
    return;
  }
  g_exit_code = unw1ndtool::commands::backtrace(options);
}

void cmd_modules(args::Subparser& parser) {
  parser.Parse();

  unw1ndtool::commands::modules_options options;
  if (!load_common(options.common)) {
    g_exit_code = 1;
    return;
  }
  g_exit_code = unw1ndtool::commands::modules(options);
}

void cmd_rows(args::Subparser& parser) {
  args::Positional<std::string> address_arg(parser, "address", "runtime address (default: inside this tool)");
  parser.Parse();

  unw1ndtool::commands::rows_options options;
  if (!load_common(options.common)) {
    g_exit_code = 1;
    return;
  }
  if (address_arg && !unw1ndtool::commands::parse_address(args::get(address_arg), options.address)) {
    log_main.err("invalid address", redlog::field("address", args::get(address_arg)));
    std::cerr << "error: invalid address " << args::get(address_arg) << std::endl;
    g_exit_code = 1;
    return;
  }
  g_exit_code = unw1ndtool::commands::rows(options);
}

void cmd_sample(args::Subparser& parser) {
  args::ValueFlag<size_t> samples_flag(parser, "count", "number of SIGPROF samples", {'s', "samples"});
  parser.Parse();

  unw1ndtool::commands::sample_options options;
  if (!load_common(options.common)) {
    g_exit_code = 1;
    return;
  }
  if (samples_flag) {
    options.samples = args::get(samples_flag);
  }
  g_exit_code = unw1ndtool::commands::sample(options);
}

int main(int argc, char* argv[]) {
  args::ArgumentParser parser("unw1ndtool - call frame unwinder", "walk this process's stack using .eh_frame");
  parser.helpParams.showTerminator = false;

  args::GlobalOptions globals(parser, cli::arguments);
  args::Group commands(parser, "commands");

  args::Command backtrace_cmd(commands, "backtrace", "walk and print the current stack", &cmd_backtrace);
  args::Command modules_cmd(commands, "modules", "list loaded modules with unwind info", &cmd_modules);
  args::Command rows_cmd(commands, "rows", "show the unwind rows covering an address", &cmd_rows);
  args::Command sample_cmd(commands, "sample", "walk the stack from a SIGPROF handler", &cmd_sample);

  try {
    parser.ParseCLI(argc, argv);
  } catch (args::Help) {
    std::cout << parser;
    return 0;
  } catch (args::Error& e) {
    std::cerr << e.what() << std::endl << parser;
    return 1;
  }

  return g_exit_code;
}
