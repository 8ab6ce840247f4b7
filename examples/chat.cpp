#include <deadsimple/deadsimple.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <vector>

using namespace deadsimple;

namespace {

struct Message {
  std::string username;
  std::string message;
};

using Messages = std::vector<Message>;

struct History {
  Messages messages;
};

constexpr std::string_view kChatPage = R"(<!DOCTYPE html>
<html>
  <head><title>deadsimple chat</title></head>
  <body>
    <ul id="messages"></ul>
    <input id="username" placeholder="username">
    <input id="message" placeholder="message">
    <button onclick="send()">Send</button>
    <script>
      function render(history) {
        const list = document.getElementById('messages');
        list.innerHTML = '';
        for (const m of history.messages) {
          const item = document.createElement('li');
          item.textContent = m.username + ': ' + m.message;
          list.appendChild(item);
        }
      }
      function refresh() {
        fetch('/history').then(r => r.json()).then(render);
      }
      function send() {
        fetch('/chat', {
          method: 'POST',
          body: JSON.stringify({
            username: document.getElementById('username').value,
            message: document.getElementById('message').value
          })
        }).then(r => r.json()).then(render);
      }
      setInterval(refresh, 1000);
      refresh();
    </script>
  </body>
</html>
)";

Response GetHistory(const Request<Messages>& req) { return Response::Json(History{*req.sharedState->lock()}); }

Response PostChat(const Request<Messages>& req) {
  const auto fields = ParseJson<std::map<std::string, std::string>>(req.body);
  if (!fields) {
    return Response::Error(WebError::BadRequest);
  }
  const auto username = fields->find("username");
  const auto message = fields->find("message");
  if (username == fields->end() || message == fields->end()) {
    return Response::Error(WebError::BadRequest);
  }

  req.sharedState->lock()->push_back(Message{username->second, message->second});

  return GetHistory(req);
}

}  // namespace

int main(int argc, char** argv) {
  const std::string_view address = argc > 1 ? argv[1] : "127.0.0.1:8000";

  SignalHandler::Enable();

  try {
    WebService<Messages>(address, Messages{})
        .registerRoute("/", http::Method::GET,
                       [](const Request<Messages>&) { return Response::Html(std::string(kChatPage)); })
        .registerRoute("/chat", http::Method::POST, PostChat)
        .registerRoute("/history", http::Method::GET, GetHistory)
        .listen(false);
  } catch (const std::exception& e) {
    std::cerr << "Server encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
