#include "file_resolver.hpp"
#include "utils/console.hpp"
#include <system_error>

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

FileResolver::FileResolver(fs::path root, std::string index_file)
    : root_(std::move(root)), index_file_(std::move(index_file)) {
  std::error_code ec;
  fs::path canonical = fs::weakly_canonical(root_, ec);
  root_ = ec ? root_.lexically_normal() : canonical;
}

std::optional<std::string>
FileResolver::percent_decode(std::string_view input) {
  std::string out;
  out.reserve(input.size());

  for (size_t i = 0; i < input.size(); ++i) {
    if (input[i] != '%') {
      out.push_back(input[i]);
      continue;
    }
    if (i + 2 >= input.size()) {
      return std::nullopt;
    }
    int hi = hex_value(input[i + 1]);
    int lo = hex_value(input[i + 2]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<char>(hi * 16 + lo));
    i += 2;
  }

  return out;
}

std::string_view FileResolver::path_part(std::string_view target) {
  size_t end = target.find_first_of("?#");
  return target.substr(0, end);
}

bool FileResolver::contains(const fs::path &path) const {
  fs::path relative = path.lexically_relative(root_);
  if (relative.empty()) {
    return false;
  }
  return *relative.begin() != "..";
}

Resolution FileResolver::classify(const fs::path &path) const {
  std::error_code ec;
  fs::file_status st = fs::status(path, ec);

  if (ec) {
    if (ec == std::errc::no_such_file_or_directory ||
        ec == std::errc::not_a_directory) {
      return {ResolveStatus::not_found, path, ec.message()};
    }
    if (ec == std::errc::permission_denied) {
      return {ResolveStatus::forbidden, path, ec.message()};
    }
    return {ResolveStatus::error, path, ec.message()};
  }

  if (fs::is_directory(st)) {
    return {ResolveStatus::directory, path, {}};
  }
  if (fs::is_regular_file(st)) {
    return {ResolveStatus::file, path, {}};
  }
  return {ResolveStatus::not_found, path, "not a regular file"};
}

Resolution FileResolver::resolve(std::string_view target) const {
  std::string_view raw = path_part(target);

  if (raw.empty() || raw.front() != '/') {
    return {ResolveStatus::bad_request, {}, "non-absolute path"};
  }

  auto decoded = percent_decode(raw);
  if (!decoded) {
    return {ResolveStatus::bad_request, {}, "invalid percent-encoding"};
  }
  if (decoded->find('\0') != std::string::npos) {
    return {ResolveStatus::bad_request, {}, "NUL in path"};
  }

  std::string relative = *decoded;
  size_t first = relative.find_first_not_of('/');
  relative = first == std::string::npos ? "" : relative.substr(first);

  fs::path path = (root_ / relative).lexically_normal();
  if (!contains(path)) {
    console::debug("rejected path outside root: " + *decoded);
    return {ResolveStatus::not_found, {}, "outside root"};
  }

  // Symlinks inside the tree may still point elsewhere.
  std::error_code ec;
  fs::path real = fs::weakly_canonical(path, ec);
  if (!ec && !contains(real)) {
    console::debug("rejected symlink outside root: " + real.string());
    return {ResolveStatus::not_found, {}, "symlink outside root"};
  }

  console::debug("URL · path : " + std::string(target) + " · " +
                 path.string());
  return classify(path);
}

Resolution FileResolver::resolve_with_index(std::string_view target) const {
  Resolution resolution = resolve(target);
  if (resolution.status != ResolveStatus::directory) {
    return resolution;
  }

  fs::path index = resolution.path / index_file_;
  console::debug("trying " + index.string() + " for directory URL");

  Resolution indexed = classify(index);
  if (indexed.status == ResolveStatus::directory) {
    return {ResolveStatus::not_found, index, "index is a directory"};
  }
  return indexed;
}
