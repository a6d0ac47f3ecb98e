#include "core/client_script.hpp"
#include "doctest/doctest.h"

DOCTEST_TEST_CASE("script tag goes before the last closing body tag") {
  std::string html = "<html><body><p>x</p></body></html>";
  std::string out = inject_reload_script(html, "/lr.js");
  DOCTEST_CHECK(out == "<html><body><p>x</p><script defer "
                       "src=\"/lr.js\"></script>\n</body></html>");
}

DOCTEST_TEST_CASE("documents without a body tag get the script appended") {
  std::string out = inject_reload_script("<p>fragment</p>", "/lr.js");
  DOCTEST_CHECK(out ==
                "<p>fragment</p><script defer src=\"/lr.js\"></script>\n");
}

DOCTEST_TEST_CASE("client script placeholders are filled in") {
  std::string script = render_client_script(9999, "/reload-here");
  DOCTEST_CHECK(script.find(":9999/reload-here") != std::string::npos);
  DOCTEST_CHECK(script.find("\"reload\"") != std::string::npos);
}
