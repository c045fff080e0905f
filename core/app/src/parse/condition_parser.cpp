#include "cadence/parse/condition_parser.hpp"
#include "cadence/condition/composite.hpp"
#include "cadence/condition/condition_errors.hpp"

#include <cctype>
#include <exception>
#include <utility>

namespace cadence {

namespace {

std::string trim(const std::string& s) {
  std::size_t begin = 0;
  std::size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(begin, end - begin);
}

bool equals_icase(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

bool is_operator(char c) {
  return c == '(' || c == ')' || c == '&' || c == '|' || c == '~';
}

// -----------------------------------------------------------------------------
// ExpressionReader: recursive descent over one expression string
// -----------------------------------------------------------------------------
//   expr   := term   ('|' term)*
//   term   := factor ('&' factor)*
//   factor := '~' factor | '(' expr ')' | item
// -----------------------------------------------------------------------------
class ExpressionReader {
 public:
  ExpressionReader(const ConditionParser& parser, const std::string& text)
      : parser_(parser), text_(text) {}

  ConditionPtr read() {
    ConditionPtr result = readExpr();
    skipSpace();
    if (pos_ != text_.size()) {
      fail("unexpected '" + std::string(1, text_[pos_]) + "'");
    }
    return result;
  }

 private:
  ConditionPtr readExpr() {
    ConditionPtr left = readTerm();
    while (consume('|')) {
      left = or_(std::move(left), readTerm());
    }
    return left;
  }

  ConditionPtr readTerm() {
    ConditionPtr left = readFactor();
    while (consume('&')) {
      left = and_(std::move(left), readFactor());
    }
    return left;
  }

  ConditionPtr readFactor() {
    if (consume('~')) {
      return not_(readFactor());
    }
    if (consume('(')) {
      ConditionPtr inner = readExpr();
      if (!consume(')')) {
        fail("missing ')'");
      }
      return inner;
    }
    return readItem();
  }

  ConditionPtr readItem() {
    skipSpace();
    const std::size_t start = pos_;
    while (pos_ < text_.size() && !is_operator(text_[pos_])) {
      ++pos_;
    }
    const std::string item = trim(text_.substr(start, pos_ - start));
    if (item.empty()) {
      fail("expected a condition");
    }
    return parser_.parseItem(item);
  }

  bool consume(char op) {
    skipSpace();
    if (pos_ < text_.size() && text_[pos_] == op) {
      ++pos_;
      return true;
    }
    return false;
  }

  void skipSpace() {
    while (pos_ < text_.size() &&
           std::isspace(static_cast<unsigned char>(text_[pos_]))) {
      ++pos_;
    }
  }

  [[noreturn]] void fail(const std::string& message) const {
    throw ConditionParseError(text_, message + " at offset " +
                                         std::to_string(pos_));
  }

  const ConditionParser& parser_;
  const std::string& text_;
  std::size_t pos_{0};
};

}  // namespace

void ConditionParser::addRule(const std::string& pattern, Factory factory) {
  Rule rule;
  rule.source = pattern;
  rule.pattern =
      std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
  rule.factory = std::move(factory);
  rules_.push_back(std::move(rule));
}

void ConditionParser::addExact(const std::string& text, Factory factory) {
  Rule rule;
  rule.source = text;
  rule.exact = true;
  rule.factory = std::move(factory);
  rules_.push_back(std::move(rule));
}

// -----------------------------------------------------------------------------
// parseItem(): first accepting rule wins
// -----------------------------------------------------------------------------
ConditionPtr ConditionParser::parseItem(const std::string& text) const {
  const std::string item = trim(text);

  for (const auto& rule : rules_) {
    Captures captures;
    if (rule.exact) {
      if (!equals_icase(item, rule.source)) {
        continue;
      }
    } else {
      std::smatch match;
      if (!std::regex_match(item, match, rule.pattern)) {
        continue;
      }
      for (std::size_t i = 1; i < match.size(); ++i) {
        captures.push_back(match[i].str());
      }
    }

    try {
      ConditionPtr condition = rule.factory(captures);
      if (condition) {
        return condition;
      }
    } catch (const ConditionParseError&) {
      // Declined by the factory: try the next rule.
      continue;
    } catch (const std::exception& e) {
      throw ConditionParseError(item, std::string("invalid condition (") +
                                          e.what() + ")");
    }
  }

  throw ConditionParseError(item, "cannot parse the condition");
}

ConditionPtr ConditionParser::parse(const std::string& expression) const {
  return ExpressionReader(*this, expression).read();
}

}  // namespace cadence
