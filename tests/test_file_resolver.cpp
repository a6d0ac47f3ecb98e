#include "core/file_resolver.hpp"
#include "core/mime_types.hpp"
#include "doctest/doctest.h"
#include "test_support.hpp"

DOCTEST_TEST_CASE("resolves files and directories under the root") {
  TempDir root;
  root.write("index.html", "<h1>home</h1>");
  root.write("docs/guide.txt", "guide");
  root.mkdir("empty");

  FileResolver resolver(root.path());

  auto file = resolver.resolve("/docs/guide.txt");
  DOCTEST_REQUIRE(file.status == ResolveStatus::file);
  DOCTEST_CHECK(file.path == root.path() / "docs" / "guide.txt");

  DOCTEST_CHECK(resolver.resolve("/docs").status == ResolveStatus::directory);
  DOCTEST_CHECK(resolver.resolve("/").status == ResolveStatus::directory);
  DOCTEST_CHECK(resolver.resolve("/missing.css").status ==
                ResolveStatus::not_found);
  DOCTEST_CHECK(resolver.resolve("/docs/guide.txt/extra").status ==
                ResolveStatus::not_found);
}

DOCTEST_TEST_CASE("directories resolve to their index file") {
  TempDir root;
  root.write("index.html", "<h1>home</h1>");
  root.write("blog/index.html", "<h1>blog</h1>");
  root.mkdir("empty");

  FileResolver resolver(root.path());

  auto home = resolver.resolve_with_index("/");
  DOCTEST_REQUIRE(home.status == ResolveStatus::file);
  DOCTEST_CHECK(home.path == root.path() / "index.html");

  auto blog = resolver.resolve_with_index("/blog/");
  DOCTEST_REQUIRE(blog.status == ResolveStatus::file);
  DOCTEST_CHECK(blog.path == root.path() / "blog" / "index.html");

  DOCTEST_CHECK(resolver.resolve_with_index("/empty/").status ==
                ResolveStatus::not_found);
}

DOCTEST_TEST_CASE("index file name is configurable") {
  TempDir root;
  root.write("default.htm", "x");

  FileResolver resolver(root.path(), "default.htm");
  auto res = resolver.resolve_with_index("/");
  DOCTEST_REQUIRE(res.status == ResolveStatus::file);
  DOCTEST_CHECK(res.path.filename() == "default.htm");
}

DOCTEST_TEST_CASE("paths escaping the root are not found") {
  TempDir outer;
  outer.write("secret.txt", "secret");
  outer.write("site/index.html", "site");

  FileResolver resolver(outer.path() / "site");

  DOCTEST_CHECK(resolver.resolve("/../secret.txt").status ==
                ResolveStatus::not_found);
  DOCTEST_CHECK(resolver.resolve("/../../etc/passwd").status ==
                ResolveStatus::not_found);
  DOCTEST_CHECK(resolver.resolve("/%2e%2e/secret.txt").status ==
                ResolveStatus::not_found);
  DOCTEST_CHECK(resolver.resolve("/a/../../secret.txt").status ==
                ResolveStatus::not_found);
  DOCTEST_CHECK(resolver.resolve("//etc/passwd").status !=
                ResolveStatus::file);

  // A path that wanders out and back in is fine.
  DOCTEST_CHECK(resolver.resolve("/x/../index.html").status ==
                ResolveStatus::file);
}

DOCTEST_TEST_CASE("symlinks pointing outside the root are not followed") {
  TempDir outer;
  outer.write("secret.txt", "secret");
  outer.mkdir("site");

  std::error_code ec;
  fs::create_symlink(outer.path() / "secret.txt",
                     outer.path() / "site" / "link.txt", ec);
  if (ec) {
    DOCTEST_MESSAGE("symlinks unavailable: " << ec.message());
    return;
  }

  FileResolver resolver(outer.path() / "site");
  DOCTEST_CHECK(resolver.resolve("/link.txt").status ==
                ResolveStatus::not_found);
}

DOCTEST_TEST_CASE("request targets are percent-decoded without the query") {
  TempDir root;
  root.write("a b.txt", "spaced");

  FileResolver resolver(root.path());

  auto res = resolver.resolve("/a%20b.txt?v=3#top");
  DOCTEST_REQUIRE(res.status == ResolveStatus::file);
  DOCTEST_CHECK(res.path.filename() == "a b.txt");

  DOCTEST_CHECK(resolver.resolve("relative.txt").status ==
                ResolveStatus::bad_request);
  DOCTEST_CHECK(resolver.resolve("/bad%zzescape").status ==
                ResolveStatus::bad_request);
  DOCTEST_CHECK(resolver.resolve("/trailing%2").status ==
                ResolveStatus::bad_request);
  DOCTEST_CHECK(resolver.resolve("/nul%00.txt").status ==
                ResolveStatus::bad_request);
}

DOCTEST_TEST_CASE("percent_decode") {
  DOCTEST_CHECK(FileResolver::percent_decode("/plain") == "/plain");
  DOCTEST_CHECK(FileResolver::percent_decode("%41%62%2F") == "Ab/");
  DOCTEST_CHECK_FALSE(FileResolver::percent_decode("%4").has_value());
  DOCTEST_CHECK_FALSE(FileResolver::percent_decode("%g1").has_value());
}

DOCTEST_TEST_CASE("mime types come from the extension") {
  DOCTEST_CHECK(mime_type_for("index.html") == "text/html");
  DOCTEST_CHECK(mime_type_for("STYLE.CSS") == "text/css");
  DOCTEST_CHECK(mime_type_for("app.js") == "application/javascript");
  DOCTEST_CHECK(mime_type_for("logo.svg") == "image/svg+xml");
  DOCTEST_CHECK(mime_type_for("archive.xyz") == "application/octet-stream");
  DOCTEST_CHECK(mime_type_for("Makefile") == "application/octet-stream");
}
