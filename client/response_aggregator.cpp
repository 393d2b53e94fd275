#include "client/response_aggregator.hh"
#include "client/errors.hh"
#include "log/logging.hh"

namespace courier {
namespace {

auto too_large(const exchange& ex, std::size_t max) -> client_error {
  return client_error{client_errc::content_too_large,
      ex.request.target().to_string() + ": response content exceeds " + std::to_string(max) + " bytes"};
}

}		// end of local namespace

received_response::received_response(status c, header_map h, std::string b) :
    code{std::move(c)}, fields{std::move(h)}, content{std::move(b)} {
  if (const auto type = fields.get("Content-Type"); type) {
    media = media_type::parse(*type);
  }
}

auto aggregate_response(exchange ex, std::size_t max_content_length) -> awaitable<received_response> {
  auto conn{ex.conn.get()};
  const auto& framing{conn->framing()};
  if (framing.how == body_framing::kind::length && framing.length > max_content_length) {
    LOG(WARNING) << "declared content length " << framing.length << " of "
                 << ex.request.target().to_string() << " exceeds " << max_content_length << ENDL;
    ex.control->clear_abort();
    ex.conn.evict();
    throw too_large(ex, max_content_length);
  }

  std::string body;
  if (framing.how == body_framing::kind::length) {
    body.reserve(framing.length);
  }
  LOG(TRACE) << "connection " << conn->id() << ": reading body" << ENDL;
  while (auto chunk = co_await conn->read_body()) {
    if (body.size() + chunk->size() > max_content_length) {
      // HTTP/1.1 cannot abandon a body and keep the framing, close it
      LOG(WARNING) << "response content of " << ex.request.target().to_string()
                   << " exceeds " << max_content_length << " bytes, closing connection "
                   << conn->id() << ENDL;
      ex.control->clear_abort();
      ex.conn.evict();
      throw too_large(ex, max_content_length);
    }
    body.append(chunk->data(), chunk->size());
  }
  ex.control->clear_abort();
  LOG(TRACE) << "connection " << conn->id() << ": complete, " << body.size() << " body bytes" << ENDL;
  ex.conn.release();
  co_return received_response{ex.head.code, std::move(ex.head.headers), std::move(body)};
}

}	// end of namespace courier
