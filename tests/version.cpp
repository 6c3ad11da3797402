#include "relgate/version.hpp"

#include "fixture.hpp"

#include <iostream>
#include <string>

static bool throws(const std::filesystem::path &root, const std::filesystem::path &file,
                   std::string_view pattern = {}) {
  try {
    (void)relgate::read_version(root, file, pattern);
  } catch (const std::exception &) {
    return true;
  }
  return false;
}

int main() {
  const fixture::TempDir tmp{"relgate_version"};
  const auto &root = tmp.path();

  try {
    // 1) Plain VERSION file: first meaningful line, trimmed
    fixture::write_file(root / "VERSION", "# release version\n\n  1.2.0  \n2.0.0\n");
    if (relgate::read_version(root, "VERSION") != "1.2.0") {
      std::cerr << "plain version mismatch\n";
      return 1;
    }

    // 2) Pattern with a capture group over a source file
    fixture::write_file(root / "pkg/__about__.py",
                        "__title__ = \"pkg\"\n__version__ = \"3.4.5\"\n__summary__ = \"x\"\n");
    if (relgate::read_version(root, "pkg/__about__.py", R"re(__version__\s*=\s*"([^"]+)")re") !=
        "3.4.5") {
      std::cerr << "pattern version mismatch\n";
      return 1;
    }

    // 3) Pattern without groups uses the whole match
    fixture::write_file(root / "CHANGES", "Release notes for 4.0.1 follow\n");
    if (relgate::read_version(root, "CHANGES", R"(\d+\.\d+\.\d+)") != "4.0.1") {
      std::cerr << "whole-match version mismatch\n";
      return 1;
    }

    // 4) Absolute version file path
    if (relgate::read_version("/nonexistent", root / "VERSION") != "1.2.0") {
      std::cerr << "absolute version path not honoured\n";
      return 1;
    }

    // 5) Failures are loud
    fixture::write_file(root / "EMPTY", "\n# nothing here\n");
    fixture::write_file(root / "SPACED", "1.0 beta\n");
    if (!throws(root, "MISSING") || !throws(root, "EMPTY") || !throws(root, "SPACED") ||
        !throws(root, "CHANGES", "no-match-(\\d+)") || !throws(root, "CHANGES", "([unclosed")) {
      std::cerr << "expected version resolution failures\n";
      return 1;
    }

    std::cout << "version OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
