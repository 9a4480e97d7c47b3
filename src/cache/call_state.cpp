#include "cache/call_state.h"
#include <sstream>
#include <type_traits>

namespace memoflow {
namespace cache {

bool same_state(const CallState &a, const CallState &b) {
  if (a.index() != b.index()) {
    return false;
  }
  return a == b;
}

std::string describe_state(const CallState &state) {
  std::ostringstream oss;
  std::visit(
      [&oss](const auto &value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
          oss << (value ? "true" : "false");
        } else if constexpr (std::is_same_v<T, std::string>) {
          oss << '"' << value << '"';
        } else {
          oss << value;
        }
      },
      state);
  return oss.str();
}

} // namespace cache
} // namespace memoflow
