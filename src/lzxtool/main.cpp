#include <cstdlib>
#include <iostream>
#include <string>

#include <args.hxx>
#include <redlog.hpp>

#include "lzxbase/cli/verbosity.hpp"
#include "lzxbase/env_config.hpp"

#include "commands/index.hpp"
#include "commands/inspect.hpp"
#include "commands/read_index.hpp"

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});

const lzx::util::env_config& env() {
  static const lzx::util::env_config config("LZX");
  return config;
}

void apply_verbosity() { lzx::cli::apply_verbosity(args::get(verbosity_flag), env()); }
} // namespace cli

namespace {
int g_exit_code = 0;
} // namespace

void cmd_index(args::Subparser& parser) {
  args::Positional<std::string> file(parser, "file", "path to lzop file");
  args::ValueFlag<std::string> output(parser, "path", "index output path (default: <file>.index)", {'o', "output"});
  args::Flag library_gating(
      parser, "library-gating", "gate optional header fields on the tool version", {"library-gating"}
  );
  args::Flag force(parser, "force", "rebuild even when a current index exists", {'f', "force"});
  parser.Parse();
  cli::apply_verbosity();

  g_exit_code = lzxtool::commands::index(file, output, library_gating, force, cli::env());
}

void cmd_inspect(args::Subparser& parser) {
  args::Positional<std::string> file(parser, "file", "path to lzop file");
  args::Flag library_gating(
      parser, "library-gating", "gate optional header fields on the tool version", {"library-gating"}
  );
  args::Flag blocks(parser, "blocks", "list every block offset", {'b', "blocks"});
  parser.Parse();
  cli::apply_verbosity();

  g_exit_code = lzxtool::commands::inspect(file, library_gating, blocks, cli::env());
}

void cmd_read_index(args::Subparser& parser) {
  args::Positional<std::string> index(parser, "index", "path to index file");
  args::ValueFlag<std::string> source(parser, "path", "lzop file the index describes", {'s', "source"});
  parser.Parse();
  cli::apply_verbosity();

  g_exit_code = lzxtool::commands::read_index(index, source, cli::env());
}

int main(int argc, char* argv[]) {
  args::ArgumentParser parser("lzxtool - lzop block indexer", "build and inspect random-access block indexes");
  parser.helpParams.showTerminator = false;

  args::GlobalOptions globals(parser, cli::arguments);
  args::Group commands(parser, "commands");

  args::Command index_cmd(commands, "index", "build <file>.index for an lzop file", &cmd_index);
  args::Command inspect_cmd(commands, "inspect", "show header and block summary", &cmd_inspect);
  args::Command read_index_cmd(commands, "read-index", "print index entries", &cmd_read_index);

  try {
    parser.ParseCLI(argc, argv);
  } catch (const args::Help&) {
    std::cout << parser;
    return 0;
  } catch (const args::Error& e) {
    std::cerr << e.what() << std::endl << parser;
    return 1;
  }

  return g_exit_code;
}
