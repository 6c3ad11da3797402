#include "relgate/config.hpp"
#include "relgate/gate.hpp"
#include "relgate/repo.hpp"

#include <filesystem>
#include <iostream>
#include <utility>

int main(int argc, char ** /*argv*/) {
  if (argc > 1) {
    std::cerr << "usage: relgate\n\n";
    std::cerr << "Run inside a git working tree. Tags the current version when HEAD is on\n"
                 "the release branch and no tracked file has uncommitted changes.\n";
    return 1;
  }

  try {
    auto repo = relgate::Repository::discover(std::filesystem::current_path());
    auto cfg = relgate::load_config(repo);
    auto helper = relgate::make_process_tag_helper(cfg.tag_helper);
    const relgate::ReleaseGate gate{std::move(repo), std::move(cfg), std::move(helper), std::cout,
                                    std::cerr};
    return relgate::exit_code(gate.run());
  } catch (const std::exception &e) {
    std::cerr << "relgate: " << e.what() << "\n";
    return 1;
  }
}
