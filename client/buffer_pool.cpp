#include "client/buffer_pool.hh"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace courier {

pooled_buffer::pooled_buffer(std::unique_ptr<char[]> s, std::size_t c, std::shared_ptr<buffer_pool> p) :
  storage{std::move(s)}, cap{c}, owner{std::move(p)} {
}

pooled_buffer::pooled_buffer(pooled_buffer&& other) noexcept :
  storage{std::move(other.storage)},
  cap{std::exchange(other.cap, 0)},
  used{std::exchange(other.used, 0)},
  owner{std::move(other.owner)} {
}

pooled_buffer& pooled_buffer::operator = (pooled_buffer&& other) noexcept {
  if (this != &other) {
    release();
    storage = std::move(other.storage);
    cap = std::exchange(other.cap, 0);
    used = std::exchange(other.used, 0);
    owner = std::move(other.owner);
  }
  return *this;
}

pooled_buffer::~pooled_buffer() {
  release();
}

void pooled_buffer::resize(std::size_t n) {
  used = std::min(n, cap);
}

void pooled_buffer::release() {
  if (storage && owner) {
    owner->give_back(std::move(storage), cap);
  }
  storage.reset();
  owner.reset();
  cap = 0;
  used = 0;
}

buffer_pool::buffer_pool(only_create, std::size_t chunk_size, std::size_t max_pooled) :
  chunk{chunk_size}, max_free{max_pooled} {
  if (chunk == 0) {
    throw std::invalid_argument{"buffer pool chunk size must be positive"};
  }
}

auto buffer_pool::create(std::size_t chunk_size, std::size_t max_pooled) -> std::shared_ptr<buffer_pool> {
  return std::make_shared<buffer_pool>(only_create{}, chunk_size, max_pooled);
}

auto buffer_pool::acquire() -> pooled_buffer {
  std::unique_ptr<char[]> storage;
  {
    std::lock_guard<std::mutex> guard{lock};
    if (!free_list.empty()) {
      storage = std::move(free_list.back());
      free_list.pop_back();
      ++counters.reused;
      counters.pooled = free_list.size();
    } else {
      ++counters.allocated;
    }
  }
  if (!storage) {
    storage = std::make_unique<char[]>(chunk);
  }
  return pooled_buffer{std::move(storage), chunk, shared_from_this()};
}

void buffer_pool::give_back(std::unique_ptr<char[]> storage, std::size_t capacity) {
  if (capacity != chunk) {
    return;
  }
  std::lock_guard<std::mutex> guard{lock};
  if (free_list.size() < max_free) {
    free_list.push_back(std::move(storage));
    counters.pooled = free_list.size();
  }
}

auto buffer_pool::statistics() const -> stats {
  std::lock_guard<std::mutex> guard{lock};
  return counters;
}

void buffer_pool::clear() {
  std::lock_guard<std::mutex> guard{lock};
  free_list.clear();
  counters.pooled = 0;
}

}	// end of namespace courier
