#include "client/streamed_response.hh"
#include "client/errors.hh"
#include "log/logging.hh"
#include <boost/algorithm/string.hpp>
#include <boost/asio/dispatch.hpp>
#include <exception>

namespace courier {

struct body_stream::state {
  explicit state(exchange e) : ex{std::move(e)}, where{ex.conn->executor()} {
  }

  exchange ex;
  asio::any_io_executor where;
  std::atomic<bool> done{false};
  // only touched on `where`
  bool reading{false};
  std::size_t received{0};
};

body_stream::body_stream(exchange ex) : shared{std::make_shared<state>(std::move(ex))} {
}

body_stream& body_stream::operator = (body_stream&& other) noexcept {
  if (this != &other) {
    cancel();
    shared = std::move(other.shared);
  }
  return *this;
}

body_stream::~body_stream() {
  cancel();
}

auto body_stream::finished() const -> bool {
  return !shared || shared->done;
}

void body_stream::finish(state& st, bool complete) {
  if (st.done.exchange(true)) {
    return;
  }
  st.ex.control->clear_abort();
  st.ex.control->disarm_deadline();
  if (complete) {
    LOG(DEBUG) << "streamed body of " << st.ex.request.target().to_string() << " complete, "
               << st.received << " bytes" << ENDL;
    st.ex.conn.release();
  } else {
    LOG(DEBUG) << "streamed body of " << st.ex.request.target().to_string() << " abandoned after "
               << st.received << " bytes" << ENDL;
    st.ex.conn.evict();
  }
}

auto body_stream::pull(std::shared_ptr<state> st) -> awaitable<std::optional<pooled_buffer>> {
  if (st->done) {
    if (st->ex.control->aborted()) {
      st->ex.control->throw_if_aborted();
    }
    co_return std::nullopt;
  }
  if (st->ex.control->aborted()) {
    finish(*st, false);
    st->ex.control->throw_if_aborted();
  }

  // keep the connection alive even if the lease is evicted meanwhile
  auto conn{st->ex.conn.get()};
  std::optional<pooled_buffer> chunk;
  std::exception_ptr failure;
  st->reading = true;
  try {
    chunk = co_await conn->read_body();
  } catch (const std::exception& e) {
    LOG(DEBUG) << "reading streamed body failed: " << e.what() << ENDL;
    failure = std::current_exception();
  }
  st->reading = false;
  if (failure) {
    finish(*st, false);
    std::rethrow_exception(failure);
  }
  if (!chunk) {
    finish(*st, true);
  } else {
    st->received += chunk->size();
  }
  co_return std::move(chunk);
}

auto body_stream::async_next() -> awaitable<std::optional<pooled_buffer>> {
  if (!shared) {
    co_return std::nullopt;
  }
  co_return co_await asio::co_spawn(shared->where, pull(shared), use_awaitable);
}

auto body_stream::next() -> std::future<std::optional<pooled_buffer>> {
  if (!shared) {
    std::promise<std::optional<pooled_buffer>> none;
    none.set_value(std::nullopt);
    return none.get_future();
  }
  return asio::co_spawn(shared->where, pull(shared), asio::use_future);
}

void body_stream::cancel() {
  if (!shared || shared->done) {
    return;
  }
  auto st{shared};
  // closes the connection under a read in flight
  st->ex.control->cancel();
  asio::dispatch(st->where, [st] {
    if (!st->reading) {
      finish(*st, false);
    }
  });
}

streamed_response::streamed_response(exchange ex) :
    code{ex.head.code}, fields{ex.head.headers} {
  if (const auto type = fields.get("Content-Type"); type) {
    media = media_type::parse(*type);
  }
  if (ex.conn->framing().how == body_framing::kind::length) {
    length = ex.conn->framing().length;
  } else if (ex.conn->framing().how == body_framing::kind::none) {
    length = 0;
  }
  stream = body_stream{std::move(ex)};
}

auto streamed_response::forward_to(response_sink& sink, header_action adjust) -> awaitable<void> {
  header_map outgoing;
  for (const auto& [name, value] : fields) {
    if (!hop_by_hop(name) && !boost::algorithm::iequals(name, "Content-Length")) {
      outgoing.add(name, value);
    }
  }
  if (adjust) {
    adjust(outgoing);
  }

  std::exception_ptr failure;
  try {
    co_await sink.send_head(code, outgoing, length);
    while (auto chunk = co_await stream.async_next()) {
      co_await sink.send_chunk(chunk->view());
    }
    co_await sink.finish();
  } catch (const std::exception& e) {
    LOG(WARNING) << "forwarding response failed: " << e.what() << ENDL;
    failure = std::current_exception();
  }
  if (failure) {
    stream.cancel();
    std::rethrow_exception(failure);
  }
}

}	// end of namespace courier
