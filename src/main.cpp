#include <fstream>
#include <iostream>
#include <memory>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <core.hpp>
#include <io/json.hpp>
#include <io/report.hpp>
#include <parsing/script.hpp>

using std::string;
using std::string_view;
using std::cin, std::cout, std::cerr, std::endl;
using namespace exfalso;

constexpr string_view usage = R"(Usage: exfalso [options] <file>...

Checks Hilbert-style proofs in implicational logic with contradiction.
Reads standard input for "-". Files ending in ".json" are read as JSON proofs.

Options:
  --json               read every input as a JSON proof
  --format=text|json   output format (default: text)
  --quiet              one status line per proof
  --help               show this message

Exit status: 0 if all proofs are valid, 1 if any proof is invalid, 2 on errors.
)";

struct Options {
  bool jsonInput = false;
  bool jsonOutput = false;
  bool quiet = false;
  bool help = false;
  std::vector<string> files;
};

// Returns false on unrecognised arguments
auto parseArgs(std::span<char*> args, Options& opts) -> bool {
  for (size_t i = 1; i < args.size(); i++) {
    auto const arg = string_view(args[i]);
    if (arg == "--json") opts.jsonInput = true;
    else if (arg == "--format=text") opts.jsonOutput = false;
    else if (arg == "--format=json") opts.jsonOutput = true;
    else if (arg == "--quiet") opts.quiet = true;
    else if (arg == "--help") opts.help = true;
    else if (arg.starts_with("--")) {
      cerr << "exfalso: unrecognised option \"" << arg << "\"" << endl;
      return false;
    } else opts.files.emplace_back(arg);
  }
  return true;
}

// See: https://stackoverflow.com/questions/116038/how-do-i-read-an-entire-file-into-a-stdstring-in-c
auto readFile(std::istream& in) -> string {
  std::ostringstream sstr;
  sstr << in.rdbuf();
  return sstr.str();
}

auto main(int argc, char* argv[]) -> int {
  auto const args = std::span(argv, static_cast<size_t>(argc));
  auto opts = Options();
  if (!parseArgs(args, opts)) {
    cerr << usage;
    return 2;
  }
  if (opts.help) {
    cout << usage;
    return 0;
  }
  if (opts.files.empty()) {
    cerr << usage;
    return 2;
  }

  auto reporter = std::unique_ptr<io::Reporter>();
  if (opts.jsonOutput) reporter = std::make_unique<io::JsonReporter>(cout);
  else reporter = std::make_unique<io::TextReporter>(cout, opts.quiet);

  // Formulas of the current proof; cleared before reading the next one
  auto pool = Allocator<core::Expr>();
  auto status = 0;
  for (auto const& name: opts.files) {
    auto content = string();
    if (name == "-") {
      content = readFile(cin);
    } else {
      auto in = std::ifstream(name, std::ios::binary);
      if (!in) {
        cerr << name << ": error: cannot open file" << endl;
        status = 2;
        continue;
      }
      content = readFile(in);
    }

    pool.reset();
    try {
      auto const proof = (opts.jsonInput || name.ends_with(".json")) ? io::parseJsonProof(content, pool)
                                                                      : parsing::parseScript(content, pool);
      auto const result = proof.verify(pool);
      reporter->report(name, proof, result);
      if (std::holds_alternative<core::Failed>(result) && status == 0) status = 1;
    } catch (parsing::ParseError& e) {
      cerr << name << ":" << e.line << ":" << e.column << ": error: " << e.what() << endl;
      status = 2;
    } catch (io::FormatError& e) {
      cerr << name << ": error: " << e.what() << endl;
      status = 2;
    }
  }

  reporter->finish();
  return status;
}
