#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace courier {

class buffer_pool;

// A fixed capacity byte buffer borrowed from a buffer_pool. The storage goes
// back to the pool when the buffer is destroyed. `size()` is the number of
// bytes in use, at most `capacity()`.
class pooled_buffer {
public:
  pooled_buffer() = default;
  pooled_buffer(pooled_buffer&& other) noexcept;
  pooled_buffer& operator = (pooled_buffer&& other) noexcept;
  pooled_buffer(const pooled_buffer&) = delete;
  pooled_buffer& operator = (const pooled_buffer&) = delete;
  ~pooled_buffer();

  auto data() -> char* {
    return storage.get();
  }
  auto data() const -> const char* {
    return storage.get();
  }
  auto size() const -> std::size_t {
    return used;
  }
  auto capacity() const -> std::size_t {
    return cap;
  }
  auto empty() const -> bool {
    return used == 0;
  }
  // Set the number of bytes in use, clamped to the capacity
  void resize(std::size_t n);

  auto view() const -> std::string_view {
    return {storage.get(), used};
  }
  auto to_string() const -> std::string {
    return std::string{view()};
  }

  void release();

private:
  friend class buffer_pool;
  pooled_buffer(std::unique_ptr<char[]> s, std::size_t c, std::shared_ptr<buffer_pool> p);

  std::unique_ptr<char[]> storage;
  std::size_t cap{0};
  std::size_t used{0};
  std::shared_ptr<buffer_pool> owner;
};

// Pool of equally sized byte buffers, shared by all connections of a client.
// Safe to use from any thread.
class buffer_pool : public std::enable_shared_from_this<buffer_pool> {
  struct only_create {
    explicit only_create() = default;
  };

public:
  static constexpr std::size_t default_chunk_size{16 * 1024};
  static constexpr std::size_t default_max_pooled{64};

  struct stats {
    std::size_t allocated{0};
    std::size_t reused{0};
    std::size_t pooled{0};
  };

  static auto create(std::size_t chunk_size = default_chunk_size,
                     std::size_t max_pooled = default_max_pooled) -> std::shared_ptr<buffer_pool>;

  buffer_pool(only_create, std::size_t chunk_size, std::size_t max_pooled);

  auto acquire() -> pooled_buffer;

  auto chunk_size() const -> std::size_t {
    return chunk;
  }
  auto statistics() const -> stats;
  void clear();

private:
  friend class pooled_buffer;
  void give_back(std::unique_ptr<char[]> storage, std::size_t capacity);

  const std::size_t chunk;
  const std::size_t max_free;
  mutable std::mutex lock;
  std::vector<std::unique_ptr<char[]>> free_list;
  stats counters;
};

}	// end of namespace courier
