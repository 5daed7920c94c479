#ifndef EXFALSO_COMMON_HPP
#define EXFALSO_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <utility>
#include <variant>
#include <vector>

namespace exfalso {

  using std::int8_t;
  using std::int16_t;
  using std::int32_t;
  using std::int64_t;
  using std::ptrdiff_t;
  using std::uint8_t;
  using std::uint16_t;
  using std::uint32_t;
  using std::uint64_t;
  using std::size_t;

  // "Unreachable" mark.
  [[noreturn]] inline auto unreachable(char const* file, int line, char const* func) -> void {
    std::cerr << "\"Unreachable\" code was reached: " << file << ":" << line << ", at function " << func << std::endl;
    std::terminate();
  }

  // A binary hash function.
  // See: https://stackoverflow.com/questions/2590677/how-do-i-combine-hash-values-in-c0x
  template <typename T>
  inline auto combineHash(size_t acc, T const& v) -> size_t {
    auto const hasher = std::hash<T>{};
    return acc ^ (hasher(v) + 0x9e3779b9 + (acc << 6) + (acc >> 2)); // NOLINT(cppcoreguidelines-avoid-magic-numbers)
  }

  // "Pattern matching" on `std::variant`.
  // See: https://en.cppreference.com/w/cpp/utility/variant/visit
  // See: https://en.cppreference.com/w/cpp/language/aggregate_initialization
  template <typename... Ts>
  struct Matcher: Ts... {
    using Ts::operator()...;
  };

  // Usage: `match(variant, [&](CaseType1 v) { return ...; }, [&](CaseType2 v) { return ...; }, ...)`
  // Return values of each lambda must have the same type.
  template <typename T, typename... Ts>
  constexpr auto match(T&& variant, Ts&&... lambdas) {
    return std::visit(Matcher<Ts...>{std::forward<Ts>(lambdas)...}, std::forward<T>(variant));
  }

  // A simple region-based memory allocator (uses larger blocks than `std::deque`).
  // This ensures that allocated objects stay in the same place, like in `std::deque`.
  template <typename T>
  class Allocator {
  public:
    static constexpr size_t defaultBlockSize = 1024;

    Allocator(size_t blockSize = defaultBlockSize):
        _blockSize(blockSize) {}

    ~Allocator() noexcept {
      _deallocateBlocks();
    }

    Allocator(Allocator const&) = delete;
    auto operator=(Allocator const&) -> Allocator& = delete;

    // Destroys every object made so far; the pool may then be reused.
    auto reset() -> void {
      _deallocateBlocks();
      _blocks.clear();
      _next = 0;
    }

    template <typename... Ts>
    auto make(Ts&&... args) -> T* {
      if (_next == 0)
        _blocks.push_back(_alloc.allocate(_blockSize));
      auto const res = _blocks.back() + _next;
      std::construct_at(res, std::forward<Ts>(args)...);
      _next++;
      if (_next >= _blockSize)
        _next = 0;
      return res;
    }

    // Number of objects made since construction or the last `reset()`.
    auto size() const -> size_t {
      if (_next == 0)
        return _blockSize * _blocks.size();
      return _blockSize * (_blocks.size() - 1) + _next;
    }

  private:
    size_t _blockSize;
    std::allocator<T> _alloc;
    std::vector<T*> _blocks;
    size_t _next = 0;

    auto _deallocateBlocks() -> void {
      for (size_t i = 0; i < _blocks.size(); i++) {
        std::destroy_n(_blocks[i], (i + 1 == _blocks.size() && _next > 0) ? _next : _blockSize);
        _alloc.deallocate(_blocks[i], _blockSize);
      }
    }
  };

}

#endif // EXFALSO_COMMON_HPP
