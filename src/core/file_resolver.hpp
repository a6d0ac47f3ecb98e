#ifndef FILE_RESOLVER_HPP
#define FILE_RESOLVER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

enum class ResolveStatus {
  file,
  directory,
  not_found,   // missing, or outside the root
  forbidden,   // permission denied
  bad_request, // not an absolute path, or broken percent-encoding
  error,       // any other filesystem failure
};

struct Resolution {
  ResolveStatus status;
  fs::path path;
  // System error text, for logging only.
  std::string detail;
};

// Maps request targets to paths under a root directory. Never yields a
// path outside the root, including through symlinks.
class FileResolver {
public:
  explicit FileResolver(fs::path root, std::string index_file = "index.html");

  // Resolves a request target ("/docs/a%20b.html?x=1") to a file or
  // directory under the root.
  Resolution resolve(std::string_view target) const;

  // Like resolve(), but a directory resolves to its index file. A
  // directory without one is not_found.
  Resolution resolve_with_index(std::string_view target) const;

  const fs::path &root() const { return root_; }
  const std::string &index_file() const { return index_file_; }

  static std::optional<std::string> percent_decode(std::string_view input);

  // The path component of a target, without query or fragment.
  static std::string_view path_part(std::string_view target);

private:
  bool contains(const fs::path &path) const;
  Resolution classify(const fs::path &path) const;

  fs::path root_;
  std::string index_file_;
};

#endif // FILE_RESOLVER_HPP
