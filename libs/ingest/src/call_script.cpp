#include "solidcore/ingest/call_script.hpp"

#include <charconv>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace solidcore {
namespace ingest {

void AddressBook::add(std::string name, const common::Address& address) {
  by_address_[address] = name;
  by_name_[std::move(name)] = address;
}

std::optional<common::Address> AddressBook::find(std::string_view name) const {
  if (auto it = by_name_.find(std::string(name)); it != by_name_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::string AddressBook::name_of(const common::Address& address) const {
  if (auto it = by_address_.find(address); it != by_address_.end()) {
    return it->second;
  }
  return address.to_hex();
}

namespace {

class LineParser {
 public:
  LineParser(std::size_t line, std::vector<std::string> tokens, const AddressBook& book)
      : line_(line), tokens_(std::move(tokens)), book_(book) {}

  [[noreturn]] void error(const std::string& message) const {
    throw std::runtime_error("line " + std::to_string(line_) + ": " + message);
  }

  const std::string& next(std::string_view what) {
    if (cursor_ >= tokens_.size()) {
      error("missing " + std::string(what));
    }
    return tokens_[cursor_++];
  }

  std::uint64_t number(std::string_view what) {
    const auto& token = next(what);
    if (token == "max") {
      return common::kMaxAmount;
    }
    std::uint64_t value = 0;
    const auto* first = token.data();
    const auto* last = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
      error("invalid " + std::string(what) + " '" + token + "'");
    }
    return value;
  }

  common::Address account(std::string_view what) {
    const auto& token = next(what);
    if (auto address = book_.find(token)) {
      return *address;
    }
    if (token.starts_with("0x")) {
      try {
        return common::Address::from_hex(token);
      } catch (const std::invalid_argument& e) {
        error(std::string(what) + " '" + token + "': " + e.what());
      }
    }
    error("unknown " + std::string(what) + " '" + token + "'");
  }

  // Reserved names resolve without consuming a script token.
  common::Address named(std::string_view name) const {
    if (auto address = book_.find(name)) {
      return *address;
    }
    error("book has no '" + std::string(name) + "' entry");
  }

  void finish() const {
    if (cursor_ != tokens_.size()) {
      error("unexpected argument '" + tokens_[cursor_] + "'");
    }
  }

 private:
  std::size_t line_;
  std::vector<std::string> tokens_;
  const AddressBook& book_;
  std::size_t cursor_{0};
};

std::vector<std::string> tokenize(const std::string& text) {
  std::vector<std::string> tokens;
  std::istringstream stream(text.substr(0, text.find('#')));
  std::string token;
  while (stream >> token) {
    tokens.push_back(std::move(token));
  }
  return tokens;
}

Call parse_line(LineParser& parser) {
  Call call;

  const auto& block_token = parser.next("block");
  if (!block_token.starts_with("@")) {
    parser.error("calls start with @<block>");
  }
  std::uint64_t block = 0;
  const auto* first = block_token.data() + 1;
  const auto* last = block_token.data() + block_token.size();
  const auto [ptr, ec] = std::from_chars(first, last, block);
  if (ec != std::errc{} || ptr != last || first == last) {
    parser.error("invalid block '" + block_token + "'");
  }
  call.block = block;
  call.caller = parser.account("caller");

  const auto op = parser.next("operation");
  if (op == "transfer") {
    call.kind = CallKind::kTransfer;
    call.to = parser.account("recipient");
    call.amount = parser.number("amount");
  } else if (op == "sell") {
    call.kind = CallKind::kTransfer;
    call.to = parser.named("token");
    call.amount = parser.number("amount");
  } else if (op == "approve") {
    call.kind = CallKind::kApprove;
    call.to = parser.account("spender");
    call.amount = parser.number("amount");
  } else if (op == "transfer_from") {
    call.kind = CallKind::kTransferFrom;
    call.from = parser.account("owner");
    call.to = parser.account("recipient");
    call.amount = parser.number("amount");
  } else if (op == "enhance") {
    call.kind = CallKind::kEnhanceValue;
    call.value = parser.number("value");
  } else if (op == "retrieve") {
    call.kind = CallKind::kRetrieveValue;
    call.amount = parser.number("amount");
  } else if (op == "buy") {
    call.kind = CallKind::kBuy;
    call.value = parser.number("value");
  } else if (op == "add_liquidity") {
    call.kind = CallKind::kAddLiquidity;
    call.value = parser.number("value");
    call.amount = parser.number("unlock block");
  } else if (op == "extend_lock") {
    call.kind = CallKind::kExtendLiquidityLock;
    call.amount = parser.number("unlock block");
  } else if (op == "remove_liquidity") {
    call.kind = CallKind::kRemoveLiquidity;
  } else {
    parser.error("unknown operation '" + op + "'");
  }

  parser.finish();
  return call;
}

}  // namespace

std::vector<ScriptedCall> parse_call_script(std::istream& in, const AddressBook& book) {
  std::vector<ScriptedCall> calls;
  std::string text;
  std::size_t line = 0;
  while (std::getline(in, text)) {
    ++line;
    auto tokens = tokenize(text);
    if (tokens.empty()) {
      continue;
    }
    LineParser parser(line, std::move(tokens), book);
    calls.push_back(ScriptedCall{.line = line, .call = parse_line(parser)});
  }
  return calls;
}

std::vector<ScriptedCall> load_call_script(const std::filesystem::path& path,
                                           const AddressBook& book) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open call script: " + path.string());
  }
  return parse_call_script(in, book);
}

}  // namespace ingest
}  // namespace solidcore
