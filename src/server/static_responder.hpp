#ifndef STATIC_RESPONDER_HPP
#define STATIC_RESPONDER_HPP

#include "core/file_resolver.hpp"
#include "reply.hpp"
#include <string>

// Serves files from the resolver's root for GET and HEAD requests.
class StaticResponder {
public:
  // HTML responses get a tag loading script_path; an empty script_path
  // turns injection off.
  StaticResponder(const FileResolver &resolver, std::string script_path);

  Reply respond(const Request &req) const;

private:
  Reply redirect_to_directory(const Request &req) const;
  Reply serve_file(const Request &req, const fs::path &path) const;
  Reply serve_html(const Request &req, const fs::path &path) const;
  Reply resolution_error(const Request &req,
                         const Resolution &resolution) const;

  const FileResolver &resolver_;
  std::string script_path_;
};

#endif // STATIC_RESPONDER_HPP
