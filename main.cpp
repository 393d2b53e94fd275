#include "client/http_client.hh"
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
  if (argc != 2 && argc != 3) {
    std::cout << "Usage: courier_fetch <url> [max-content-length]\n";
    std::cout << "Example:\n";
    std::cout << "  courier_fetch http://www.boost.org/LICENSE_1_0.txt 65536\n";
    return 1;
  }

  try {
    courier::client_config config;
    if (argc == 3) {
      config.max_content_length = std::stoul(argv[2]);
    }
    courier::http_client client{config};
    auto response{client.get(argv[1]).get()};
    std::cout << "HTTP " << response.status_code() << " " << response.get_status().reason << "\n";
    std::cout << response.headers() << "\n";
    std::cout << response.body() << "\n";
    return response.get_status().success() ? 0 : 2;
  } catch (const courier::client_error& e) {
    std::cerr << "request failed: " << e.what() << "\n";
    return -1;
  } catch (const std::exception& e) {
    std::cerr << "Exception: " << e.what() << "\n";
    return -1;
  }
}
