#ifndef SWEVAL_CORE_HASH_HPP_
#define SWEVAL_CORE_HASH_HPP_

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace sweval::core {

// FNV-1a 64-bit. Platform-stable, so keys derived from it (image names) are
// reproducible across machines and compilers, unlike std::hash.
class Fnv1a64 {
public:
  void Update(std::string_view bytes) {
    for (const char c : bytes) {
      state_ ^= static_cast<std::uint8_t>(c);
      state_ *= kPrime;
    }
  }

  // Length-prefixed update so ("ab","c") and ("a","bc") hash differently.
  void UpdateField(std::string_view field) {
    Update(std::to_string(field.size()));
    Update(":");
    Update(field);
  }

  std::uint64_t Digest() const {
    return state_;
  }

  std::string HexDigest() const {
    std::ostringstream out;
    out << std::hex << std::setw(16) << std::setfill('0') << state_;
    return out.str();
  }

private:
  static constexpr std::uint64_t kOffsetBasis = 0xcbf29ce484222325ULL;
  static constexpr std::uint64_t kPrime = 0x100000001b3ULL;

  std::uint64_t state_ = kOffsetBasis;
};

} // namespace sweval::core

#endif // SWEVAL_CORE_HASH_HPP_
