#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "solidcore/common/types.hpp"
#include "solidcore/ingest/call.hpp"

namespace solidcore {
namespace ingest {

// Name <-> address mapping used to resolve call scripts.
class AddressBook {
 public:
  void add(std::string name, const common::Address& address);
  [[nodiscard]] std::optional<common::Address> find(std::string_view name) const;
  // Returns the registered name, or the hex form for unknown addresses.
  [[nodiscard]] std::string name_of(const common::Address& address) const;

 private:
  std::unordered_map<std::string, common::Address> by_name_{};
  std::unordered_map<common::Address, std::string> by_address_{};
};

struct ScriptedCall {
  std::size_t line{0};
  Call call{};
};

// Line format: `@<block> <caller> <op> [args...]`; `#` starts a comment.
//   transfer <to> <amount>            sell <amount>
//   approve <spender> <amount>        transfer_from <from> <to> <amount>
//   enhance <value>                   retrieve <amount>
//   buy <value>                       add_liquidity <value> <unlock_block>
//   extend_lock <unlock_block>        remove_liquidity
// Accounts are names from the book or 0x-prefixed hex; amounts accept `max`.
// `sell` needs the book to contain the reserved name "token".
// Throws std::runtime_error naming the offending line.
std::vector<ScriptedCall> parse_call_script(std::istream& in, const AddressBook& book);
std::vector<ScriptedCall> load_call_script(const std::filesystem::path& path,
                                           const AddressBook& book);

}  // namespace ingest
}  // namespace solidcore
