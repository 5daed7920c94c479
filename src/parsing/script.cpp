#include "script.hpp"
#include <charconv>
#include <vector>

using std::string;
using std::string_view;
using std::vector;

namespace exfalso::parsing {
#include "macros_open.hpp"

  using core::Expr;

  namespace {

    struct Token {
      string_view s;
      size_t column; // 1-based
    };

    // Splits a line at spaces and tabs, dropping everything after `#`.
    auto tokenize(string_view line) -> vector<Token> {
      auto res = vector<Token>();
      if (auto const p = line.find('#'); p != string_view::npos)
        line = line.substr(0, p);
      auto i = size_t{0};
      while (i < line.size()) {
        if (line[i] == ' ' || line[i] == '\t' || line[i] == '\r') {
          i++;
          continue;
        }
        auto const start = i;
        while (i < line.size() && line[i] != ' ' && line[i] != '\t' && line[i] != '\r')
          i++;
        res.push_back({line.substr(start, i - start), start + 1});
      }
      return res;
    }

    class ScriptReader {
    public:
      explicit ScriptReader(Allocator<Expr>& pool):
          pool(pool) {}

      auto line(size_t n, vector<Token> const& tokens) -> void {
        lineNumber = n;
        auto const& head = tokens.front();
        if (head.s == "goal") {
          arity(tokens, 1);
          if (goal) throw error(head, "duplicate goal, first given at line " + std::to_string(goalLine));
          goal = formula(tokens[1]);
          goalLine = n;
        } else if (head.s == "axiom") {
          arity(tokens, 4);
          steps.emplace_back(core::AxiomStep{
            number(tokens[1]),
            {formula(tokens[2]), formula(tokens[3]), formula(tokens[4])}
          });
        } else if (head.s == "mp") {
          arity(tokens, 2);
          steps.emplace_back(core::ModusPonensStep{number(tokens[1]), number(tokens[2])});
        } else {
          throw error(head, "unknown directive \"" + string(head.s) + "\", expected goal, axiom or mp");
        }
      }

      auto finish() -> core::Proof {
        if (!goal) throw ParseError(lineNumber, 1, "missing goal directive");
        return {goal, std::move(steps)};
      }

    private:
      Allocator<Expr>& pool;
      Expr const* goal = nullptr;
      size_t goalLine = 0, lineNumber = 0;
      vector<core::Step> steps;

      auto error(Token const& t, string const& s) const -> ParseError {
        return ParseError(lineNumber, t.column, s);
      }

      auto arity(vector<Token> const& tokens, size_t n) const -> void {
        if (tokens.size() != n + 1)
          throw error(
            tokens.front(),
            "\"" + string(tokens.front().s) + "\" expects " + std::to_string(n) + " argument(s), got "
              + std::to_string(tokens.size() - 1)
          );
      }

      auto number(Token const& t) const -> size_t {
        auto res = size_t{};
        auto const [ptr, ec] = std::from_chars(t.s.data(), t.s.data() + t.s.size(), res);
        if (ec != std::errc() || ptr != t.s.data() + t.s.size())
          throw error(t, "expected line or axiom number, got \"" + string(t.s) + "\"");
        return res;
      }

      auto formula(Token const& t) const -> Expr const* {
        auto e = static_cast<Expr const*>(nullptr);
        try {
          e = parseExpr(t.s, pool);
        } catch (ParseError& ex) {
          throw ParseError(lineNumber, t.column + ex.column - 1, ex.what());
        }
        if (!e->isGround()) throw error(t, "metavariables are not allowed in proofs: " + string(t.s));
        return e;
      }
    };

  }

  auto parseScript(string_view s, Allocator<Expr>& pool) -> core::Proof {
    auto reader = ScriptReader(pool);
    auto n = size_t{0};
    while (!s.empty()) {
      n++;
      auto const p = s.find('\n');
      auto const line = s.substr(0, p);
      s = (p == string_view::npos) ? string_view() : s.substr(p + 1);
      auto const tokens = tokenize(line);
      if (!tokens.empty()) reader.line(n, tokens);
    }
    return reader.finish();
  }

#include "macros_close.hpp"
}
