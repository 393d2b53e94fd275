#pragma once
#include "client/buffer_pool.hh"
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace courier {

// Everything the client needs, handed over at construction time
struct client_config {
  static constexpr std::size_t default_max_content_length{1024 * 1024};

  // Cap for buffered response bodies. Streamed responses are not capped.
  std::size_t max_content_length{default_max_content_length};
  // Buffers used for socket reads and body chunks; a private pool is
  // created when this is empty.
  std::shared_ptr<buffer_pool> buffers;

  std::size_t workers{2};
  std::size_t max_connections_per_key{8};
  std::size_t max_idle_per_key{8};

  std::chrono::milliseconds idle_timeout{std::chrono::seconds{60}};
  std::chrono::milliseconds sweep_interval{std::chrono::seconds{5}};
  // 0 means a queued acquire waits as long as the request deadline allows
  std::chrono::milliseconds queue_timeout{0};
  std::chrono::milliseconds connect_timeout{std::chrono::seconds{10}};
  std::chrono::milliseconds request_timeout{std::chrono::seconds{30}};

  unsigned int max_redirects{10};
  bool verify_peer{true};
  std::string user_agent{"courier/1.0"};
};

}	// end of namespace courier
