#include "reply.hpp"

namespace {

std::string render_error_html(http::status status) {
  std::string title = std::to_string(static_cast<unsigned>(status)) + " " +
                      std::string(http::obsolete_reason(status));

  return "<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"utf-8\">\n"
         "<title>" +
         title + "</title>\n</head>\n<body>\n<h1>" + title +
         "</h1>\n</body>\n</html>\n";
}

} // namespace

Reply text_reply(const Request &req, http::status status, std::string body,
                 const std::string &content_type) {
  if (req.method() == http::verb::head) {
    EmptyResponse res{status, req.version()};
    res.set(http::field::server, "hotserve");
    res.set(http::field::content_type, content_type);
    res.content_length(body.size());
    res.keep_alive(req.keep_alive());
    return res;
  }

  StringResponse res{status, req.version()};
  res.set(http::field::server, "hotserve");
  res.set(http::field::content_type, content_type);
  res.body() = std::move(body);
  res.prepare_payload();
  res.keep_alive(req.keep_alive());
  return res;
}

Reply error_reply(const Request &req, http::status status) {
  return text_reply(req, status, render_error_html(status), "text/html");
}

http::status reply_status(const Reply &reply) {
  return std::visit([](const auto &res) { return res.result(); }, reply);
}

std::size_t reply_body_size(const Reply &reply) {
  return std::visit(
      [](const auto &res) -> std::size_t {
        auto length = res.payload_size();
        return length ? static_cast<std::size_t>(*length) : 0;
      },
      reply);
}
