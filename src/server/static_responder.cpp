#include "static_responder.hpp"
#include "core/client_script.hpp"
#include "core/mime_types.hpp"
#include "utils/console.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

StaticResponder::StaticResponder(const FileResolver &resolver,
                                 std::string script_path)
    : resolver_(resolver), script_path_(std::move(script_path)) {}

Reply StaticResponder::respond(const Request &req) const {
  if (req.method() != http::verb::get && req.method() != http::verb::head) {
    Reply reply = error_reply(req, http::status::method_not_allowed);
    std::visit(
        [](auto &res) { res.set(http::field::allow, "GET, HEAD"); }, reply);
    return reply;
  }

  std::string_view target = req.target();
  std::string_view path = FileResolver::path_part(target);

  // Relative links inside an index page only work from a URL ending in /.
  if (!path.empty() && path.back() != '/') {
    Resolution resolution = resolver_.resolve(target);
    if (resolution.status == ResolveStatus::directory) {
      return redirect_to_directory(req);
    }
  }

  Resolution resolution = resolver_.resolve_with_index(target);
  if (resolution.status != ResolveStatus::file) {
    return resolution_error(req, resolution);
  }

  std::string ext = resolution.path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (!script_path_.empty() && (ext == ".html" || ext == ".htm")) {
    return serve_html(req, resolution.path);
  }
  return serve_file(req, resolution.path);
}

Reply StaticResponder::redirect_to_directory(const Request &req) const {
  std::string_view target = req.target();
  std::string_view path = FileResolver::path_part(target);

  std::string location(path);
  location += '/';
  location += target.substr(path.size());

  console::debug("redirecting " + std::string(target) + " to " + location);

  Reply reply = error_reply(req, http::status::found);
  std::visit(
      [&location](auto &res) { res.set(http::field::location, location); },
      reply);
  return reply;
}

Reply StaticResponder::serve_file(const Request &req,
                                  const fs::path &path) const {
  beast::error_code ec;
  http::file_body::value_type body;
  body.open(path.c_str(), beast::file_mode::scan, ec);

  if (ec) {
    return resolution_error(
        req, {ec == beast::errc::permission_denied ? ResolveStatus::forbidden
                                                   : ResolveStatus::error,
              path, ec.message()});
  }

  const auto size = body.size();
  const std::string type = mime_type_for(path);

  if (req.method() == http::verb::head) {
    EmptyResponse res{http::status::ok, req.version()};
    res.set(http::field::server, "hotserve");
    res.set(http::field::content_type, type);
    res.content_length(size);
    res.keep_alive(req.keep_alive());
    return res;
  }

  FileResponse res{std::piecewise_construct, std::make_tuple(std::move(body)),
                   std::make_tuple(http::status::ok, req.version())};
  res.set(http::field::server, "hotserve");
  res.set(http::field::content_type, type);
  res.content_length(size);
  res.keep_alive(req.keep_alive());
  return res;
}

Reply StaticResponder::serve_html(const Request &req,
                                  const fs::path &path) const {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return resolution_error(req, {ResolveStatus::error, path,
                                  "cannot open file for reading"});
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return resolution_error(req,
                            {ResolveStatus::error, path, "read failed"});
  }

  return text_reply(req, http::status::ok,
                    inject_reload_script(buffer.str(), script_path_),
                    mime_type_for(path));
}

Reply StaticResponder::resolution_error(const Request &req,
                                        const Resolution &resolution) const {
  std::string target(req.target());

  switch (resolution.status) {
  case ResolveStatus::not_found:
  case ResolveStatus::directory:
    console::debug("not found: " + target + " (" + resolution.detail + ")");
    return error_reply(req, http::status::not_found);
  case ResolveStatus::forbidden:
    console::warn("permission denied: " + resolution.path.string());
    return error_reply(req, http::status::forbidden);
  case ResolveStatus::bad_request:
    console::warn("bad request target " + target + ": " + resolution.detail);
    return error_reply(req, http::status::bad_request);
  case ResolveStatus::error:
  case ResolveStatus::file:
    break;
  }

  console::error("cannot serve " + target + ": " + resolution.detail);
  return error_reply(req, http::status::internal_server_error);
}
