#pragma once
#include "network_fwd.hh"
#include "client/client_config.hh"
#include "client/connection_pool.hh"
#include "client/exchange_control.hh"
#include "client/http_codec.hh"
#include "client/io_workers.hh"
#include "client/request_spec.hh"
#include <memory>
#include <optional>

namespace courier {

// One request/response cycle after the response head was read. The leased
// connection is positioned at the start of the body; whoever consumes the
// body releases or evicts the lease on the connection's executor.
struct exchange {
  request_spec request;
  response_head head;
  lease conn;
  std::shared_ptr<exchange_control> control;
};

// Turns a request_spec into an exchange: acquires a connection from the
// pool of the key's worker, writes the request and reads the response head,
// following redirects when asked to.
//
// Exchange states, logged at debug level:
//   idle -> connection acquired -> headers sent -> body sent
//   -> awaiting response headers -> response headers received
//   -> streaming body -> complete
// with a side exit to failed from any of them.
class request_executor {
public:
  request_executor(io_workers& workers, const client_config& config);

  auto execute(request_spec request, std::shared_ptr<exchange_control> control) -> awaitable<exchange>;

  // The redirect to follow for this exchange, if any
  auto redirect_for(const exchange& ex) const -> std::optional<request_spec>;

private:
  // Runs on the worker owning the request's pool key
  auto send(request_spec request, std::shared_ptr<exchange_control> control) -> awaitable<exchange>;
  auto write_body(connection& conn, const request_spec& request) -> awaitable<void>;

  io_workers& workers;
  const client_config& config;
};

// Read and drop what is left of the body so the connection can be reused.
// Bodies longer than `limit` are not worth reading: the connection is closed.
// Runs on the connection's executor.
auto discard_body(exchange ex, std::size_t limit) -> awaitable<void>;

}	// end of namespace courier
