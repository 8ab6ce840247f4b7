#include <deadsimple/deadsimple.hpp>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <variant>

using namespace deadsimple;

namespace {

using Stateless = std::monostate;

struct TestValue {
  std::string test;
};

// Smallest valid GIF: one transparent pixel.
constexpr std::array<std::byte, 43> kPixelGif = {
    std::byte{0x47}, std::byte{0x49}, std::byte{0x46}, std::byte{0x38}, std::byte{0x39}, std::byte{0x61},
    std::byte{0x01}, std::byte{0x00}, std::byte{0x01}, std::byte{0x00}, std::byte{0x80}, std::byte{0x00},
    std::byte{0x00}, std::byte{0x00}, std::byte{0x00}, std::byte{0x00}, std::byte{0xff}, std::byte{0xff},
    std::byte{0xff}, std::byte{0x21}, std::byte{0xf9}, std::byte{0x04}, std::byte{0x01}, std::byte{0x00},
    std::byte{0x00}, std::byte{0x00}, std::byte{0x00}, std::byte{0x2c}, std::byte{0x00}, std::byte{0x00},
    std::byte{0x00}, std::byte{0x00}, std::byte{0x01}, std::byte{0x00}, std::byte{0x01}, std::byte{0x00},
    std::byte{0x00}, std::byte{0x02}, std::byte{0x02}, std::byte{0x44}, std::byte{0x01}, std::byte{0x00},
    std::byte{0x3b}};

constexpr std::string_view kHelloPage = R"(<!DOCTYPE html>
<html>
  <head><title>deadsimple</title></head>
  <body>
    <h1>Hello from deadsimple</h1>
    <img src="/pixel" alt="pixel">
  </body>
</html>
)";

Response Root(const Request<Stateless>& req) {
  std::string args;
  for (const auto& [key, value] : req.args) {
    if (!args.empty()) {
      args.append(", ");
    }
    args.append(key).append(": ").append(value);
  }
  return Response::Html("<h1>Hello, World! {" + args + "}</h1>");
}

Response Give(const Request<Stateless>& req) {
  // slow handler, other connections keep being served meanwhile
  std::this_thread::sleep_for(std::chrono::seconds(1));
  return Response::Json(TestValue{req.params.at("krajsy")});
}

}  // namespace

int main(int argc, char** argv) {
  const std::string_view address = argc > 1 ? argv[1] : "127.0.0.1:8000";

  // Enable signal handler for graceful shutdown on Ctrl+C
  SignalHandler::Enable();

  try {
    WebService<Stateless>(address, Stateless{})
        .registerRoute("/", http::Method::GET, Root)
        .registerRoute("/test/{krajsy}/give", http::Method::GET, Give)
        .registerRoute("/hello", http::Method::GET,
                       [](const Request<Stateless>&) { return Response::Html(std::string(kHelloPage)); })
        .registerRoute("/pixel", http::Method::GET,
                       [](const Request<Stateless>&) { return Response::Gif(std::span<const std::byte>(kPixelGif)); })
        .registerRoute("404", http::Method::GET, [](const Request<Stateless>&) { return Response::Html("404 :("); })
        .listen(true);  // blocking, until Ctrl+C
  } catch (const std::exception& e) {
    std::cerr << "Server encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
