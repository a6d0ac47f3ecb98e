#ifndef REPLY_HPP
#define REPLY_HPP

#include <boost/beast/http.hpp>
#include <string>
#include <variant>

namespace beast = boost::beast;
namespace http = beast::http;

using Request = http::request<http::string_body>;
using StringResponse = http::response<http::string_body>;
using FileResponse = http::response<http::file_body>;
using EmptyResponse = http::response<http::empty_body>;

// Every response the server writes is one of these.
using Reply = std::variant<StringResponse, FileResponse, EmptyResponse>;

// Small HTML page titled with the status line. HEAD requests get the
// headers only.
Reply error_reply(const Request &req, http::status status);

Reply text_reply(const Request &req, http::status status, std::string body,
                 const std::string &content_type);

http::status reply_status(const Reply &reply);
std::size_t reply_body_size(const Reply &reply);

#endif // REPLY_HPP
